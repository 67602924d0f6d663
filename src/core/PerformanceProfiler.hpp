/**
 * @file PerformanceProfiler.hpp
 * @brief Lightweight performance profiling for processors and chunk scheduling.
 *
 * Compile-time optional: define SPATIALIZER_ENABLE_PROFILING=1 to enable.
 */

#ifndef SPATIALIZER_PERFORMANCE_PROFILER_HPP
#define SPATIALIZER_PERFORMANCE_PROFILER_HPP

#include <chrono>
#include <cstddef>

#ifndef SPATIALIZER_ENABLE_PROFILING
#define SPATIALIZER_ENABLE_PROFILING 0
#endif

namespace spatializer {

/**
 * @brief Lightweight performance profiler for measuring execution time.
 *
 * Zero cost when profiling is disabled.
 */
class PerformanceProfiler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Nanoseconds = std::chrono::nanoseconds;

    PerformanceProfiler() = default;

#if SPATIALIZER_ENABLE_PROFILING
    void start() {
        start_time_ = Clock::now();
    }

    /**
     * @brief Stop timing measurement and store elapsed time.
     */
    void stop() {
        const auto end_time = Clock::now();
        execution_time_ = std::chrono::duration_cast<Nanoseconds>(end_time - start_time_);

        if (execution_time_ > max_execution_time_) {
            max_execution_time_ = execution_time_;
        }

        total_blocks_processed_++;
    }

    Nanoseconds elapsed() const {
        return execution_time_;
    }

    Nanoseconds max_execution_time() const {
        return max_execution_time_;
    }

    size_t total_blocks_processed() const {
        return total_blocks_processed_;
    }

    /**
     * @brief Check if the last execution exceeded the real-time budget of a block.
     *
     * @param buffer_budget Wall-clock duration of the audio in the block.
     */
    bool exceeds_budget(Nanoseconds buffer_budget) const {
        return execution_time_ > buffer_budget;
    }

    void reset() {
        execution_time_ = Nanoseconds::zero();
        max_execution_time_ = Nanoseconds::zero();
        total_blocks_processed_ = 0;
    }

private:
    TimePoint start_time_;
    Nanoseconds execution_time_{0};
    Nanoseconds max_execution_time_{0};
    size_t total_blocks_processed_{0};

#else
    void start() {}
    void stop() {}
    Nanoseconds elapsed() const { return Nanoseconds::zero(); }
    Nanoseconds max_execution_time() const { return Nanoseconds::zero(); }
    size_t total_blocks_processed() const { return 0; }
    bool exceeds_budget(Nanoseconds) const { return false; }
    void reset() {}
#endif
};

} // namespace spatializer

#endif // SPATIALIZER_PERFORMANCE_PROFILER_HPP
