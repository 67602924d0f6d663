/**
 * @file ProgressReporter.hpp
 * @brief Monotonic progress reporting and cooperative cancellation for conversions.
 */

#ifndef SPATIALIZER_PROGRESS_REPORTER_HPP
#define SPATIALIZER_PROGRESS_REPORTER_HPP

#include <atomic>
#include <functional>
#include <string_view>
#include <algorithm>
#include <cstdint>
#include <utility>

namespace spatializer {

enum class ProgressStage {
    Preparing,
    Converting,
    Finalizing,
    Complete
};

inline std::string_view stage_name(ProgressStage stage) {
    switch (stage) {
        case ProgressStage::Preparing: return "Preparing";
        case ProgressStage::Converting: return "Converting";
        case ProgressStage::Finalizing: return "Finalizing";
        case ProgressStage::Complete: return "Complete";
    }
    return "Unknown";
}

using ProgressCallback = std::function<void(int percent, ProgressStage stage)>;

/**
 * @brief Forwards progress to a callback, never going backwards.
 *
 * Percentages are coerced to 0..99 for every stage except Complete, which
 * alone may report 100. A value below the last reported one is dropped; an
 * equal value only goes through when it announces a later stage.
 */
class ProgressReporter {
public:
    static constexpr int kConvertingCeiling = 98;
    static constexpr int kFinalizingPercent = 99;
    static constexpr int kCompletePercent = 100;

    explicit ProgressReporter(ProgressCallback callback = {})
        : callback_(std::move(callback))
    {}

    void report(int percent, ProgressStage stage) {
        const int ceiling = (stage == ProgressStage::Complete) ? kCompletePercent : kFinalizingPercent;
        percent = std::clamp(percent, 0, ceiling);
        if (percent < last_ || (percent == last_ && stage <= last_stage_)) {
            return;
        }
        last_ = percent;
        last_stage_ = stage;
        if (callback_) {
            callback_(percent, stage);
        }
    }

    /**
     * @brief Report Converting progress from consumed source frames.
     *
     * Unknown totals (0) report nothing.
     */
    void report_frames(uint64_t consumed, uint64_t total) {
        if (total == 0) {
            return;
        }
        const uint64_t percent = std::min<uint64_t>(consumed * 100 / total, kConvertingCeiling);
        report(static_cast<int>(percent), ProgressStage::Converting);
    }

    int last_reported() const { return last_; }

private:
    ProgressCallback callback_;
    int last_ = -1;
    ProgressStage last_stage_ = ProgressStage::Preparing;
};

/**
 * @brief Cancellation flag shared between a controller and a running pipeline.
 *
 * The pipeline only looks at it between chunks.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    void reset() { cancelled_.store(false, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace spatializer

#endif // SPATIALIZER_PROGRESS_REPORTER_HPP
