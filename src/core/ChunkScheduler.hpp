/**
 * @file ChunkScheduler.hpp
 * @brief Fork/join upmixing of one chunk across a fixed number of workers.
 */

#ifndef SPATIALIZER_CHUNK_SCHEDULER_HPP
#define SPATIALIZER_CHUNK_SCHEDULER_HPP

#include "BufferPool.hpp"
#include "FilterBank.hpp"
#include "OutputMode.hpp"
#include "PerformanceProfiler.hpp"
#include <span>
#include <vector>
#include <cstddef>

namespace spatializer {

/**
 * @brief Half-open frame range [begin, end) handled by one worker.
 */
struct FrameRange {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end - begin; }
    bool operator==(const FrameRange&) const = default;
};

/**
 * @brief Splits chunks into contiguous frame ranges and upmixes them concurrently.
 *
 * Every worker owns its FilterBank and writes only the output slice of its
 * range, so workers share nothing but the read-only input. Each worker bank
 * is reset at the start of its range: filtered modes start every range from
 * silence and differ from a continuous run for a short transient after each
 * seam. Unfiltered modes are identical to the sequential path.
 *
 * The sequential path keeps one bank whose state runs on from call to call.
 */
class ChunkScheduler {
public:
    static constexpr size_t kDefaultWorkers = 2;

    /**
     * @param mode Output mode; fixes the channel count of every output block.
     * @param sample_rate Rate the filters are designed for.
     * @param pool Source of the output blocks. Must outlive the scheduler.
     * @param worker_count Number of partitions per chunk, clamped to at least 1.
     */
    ChunkScheduler(OutputMode mode, int sample_rate, BufferPool& pool,
                   size_t worker_count = kDefaultWorkers);

    /**
     * @brief Upmix @p frames frames of interleaved stereo across the workers.
     *
     * Returns after every worker has finished. The block holds
     * frames * channels() samples in input order.
     */
    BufferPool::BufferPtr process_chunk_parallel(std::span<const float> stereo_chunk, size_t frames);

    /**
     * @brief Upmix on the calling thread with the persistent filter bank.
     */
    BufferPool::BufferPtr process_chunk_sequential(std::span<const float> stereo_chunk, size_t frames);

    /**
     * @brief Parallel upmix into caller-owned storage of at least frames * channels() samples.
     */
    void process_parallel_into(std::span<const float> stereo_chunk, size_t frames, std::span<float> output);

    /**
     * @brief Sequential upmix into caller-owned storage.
     */
    void process_sequential_into(std::span<const float> stereo_chunk, size_t frames, std::span<float> output);

    /**
     * @brief Return the sequential bank to silence.
     */
    void reset();

    /**
     * @brief Ceil-sized contiguous partition of @p frames; empty ranges are left out.
     */
    static std::vector<FrameRange> partition(size_t frames, size_t workers);

    OutputMode mode() const { return mode_; }
    size_t channels() const { return channels_; }
    size_t worker_count() const { return worker_banks_.size(); }
    const PerformanceProfiler& profiler() const { return profiler_; }

private:
    FilterBank* bank_for(FilterBank& bank) { return uses_filters(mode_) ? &bank : nullptr; }
    void report_timing(size_t frames);

    OutputMode mode_;
    size_t channels_;
    BufferPool& pool_;
    FilterBank sequential_bank_;
    std::vector<FilterBank> worker_banks_;
    PerformanceProfiler profiler_;
};

} // namespace spatializer

#endif // SPATIALIZER_CHUNK_SCHEDULER_HPP
