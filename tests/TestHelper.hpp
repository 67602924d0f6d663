/**
 * @file TestHelper.hpp
 * @brief Deterministic test signals and in-memory collaborators for pipeline tests.
 */

#ifndef SPATIALIZER_TEST_HELPER_HPP
#define SPATIALIZER_TEST_HELPER_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <random>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "FrameSink.hpp"
#include "FrameSource.hpp"
#include "ProgressReporter.hpp"

namespace test {

inline constexpr double kPi = 3.14159265358979323846;

/**
 * @brief Interleaved stereo: 220 Hz + 3 kHz on the left, 440 Hz + 60 Hz on the right.
 */
inline std::vector<float> stereo_sine_mix(size_t frames, int sample_rate = 44100) {
    std::vector<float> out(frames * 2);
    for (size_t i = 0; i < frames; ++i) {
        const double t = static_cast<double>(i) / sample_rate;
        out[i * 2] = static_cast<float>(0.4 * std::sin(2.0 * kPi * 220.0 * t) + 0.3 * std::sin(2.0 * kPi * 3000.0 * t));
        out[i * 2 + 1] = static_cast<float>(0.4 * std::sin(2.0 * kPi * 440.0 * t) + 0.3 * std::sin(2.0 * kPi * 60.0 * t));
    }
    return out;
}

/**
 * @brief Uniform noise in [-amplitude, amplitude], reproducible for a given seed.
 */
inline std::vector<float> noise(size_t samples, uint32_t seed = 1234, float amplitude = 1.0f) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-amplitude, amplitude);
    std::vector<float> out(samples);
    for (auto& s : out) {
        s = dist(rng);
    }
    return out;
}

inline float max_abs_diff(std::span<const float> a, std::span<const float> b) {
    float diff = 0.0f;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        diff = std::max(diff, std::abs(a[i] - b[i]));
    }
    return diff;
}

/**
 * @brief FrameSource over an in-memory interleaved buffer.
 */
class FakeSource : public spatializer::hal::FrameSource {
public:
    FakeSource(std::vector<float> samples, int channels, int sample_rate, size_t max_block_frames = 0)
        : samples_(std::move(samples))
        , channels_(channels)
        , sample_rate_(sample_rate)
        , max_block_frames_(max_block_frames)
    {}

    bool open() override {
        opened_ = !fail_open;
        return opened_;
    }

    spatializer::hal::StreamFormat format() const override {
        spatializer::hal::StreamFormat f;
        f.channels = channels_;
        f.sample_rate = sample_rate_;
        f.total_frames = report_total ? samples_.size() / static_cast<size_t>(channels_) : 0;
        return f;
    }

    bool read(std::span<float> destination, size_t& frames_read) override {
        frames_read = 0;
        if (fail_at_read >= 0 && reads_ == static_cast<size_t>(fail_at_read)) {
            return false;
        }
        ++reads_;
        if (on_read) {
            on_read(reads_);
        }

        const size_t channels = static_cast<size_t>(channels_);
        const size_t total = samples_.size() / channels;
        size_t n = std::min(destination.size() / channels, total - position_);
        if (max_block_frames_ > 0) {
            n = std::min(n, max_block_frames_);
        }
        std::copy_n(samples_.begin() + position_ * channels, n * channels, destination.begin());
        position_ += n;
        frames_read = n;
        return true;
    }

    void close() override { closed_ = true; }
    std::string last_error() const override { return fail_open ? "open refused" : "read refused"; }

    bool closed() const { return closed_; }
    size_t reads() const { return reads_; }

    bool fail_open = false;
    int fail_at_read = -1;
    bool report_total = true;
    std::function<void(size_t)> on_read;

private:
    std::vector<float> samples_;
    int channels_;
    int sample_rate_;
    size_t max_block_frames_;
    size_t position_ = 0;
    size_t reads_ = 0;
    bool opened_ = false;
    bool closed_ = false;
};

/**
 * @brief FrameSink that keeps everything it receives.
 */
class FakeSink : public spatializer::hal::FrameSink {
public:
    bool open(const spatializer::hal::SinkFormat& format) override {
        format_ = format;
        opened = !fail_open;
        return opened;
    }

    bool write(std::span<const float> interleaved, size_t frames, int64_t pts_us) override {
        if (fail_at_write >= 0 && block_frames.size() == static_cast<size_t>(fail_at_write)) {
            return false;
        }
        const size_t n = frames * static_cast<size_t>(format_.channels);
        samples.insert(samples.end(), interleaved.begin(), interleaved.begin() + n);
        block_frames.push_back(frames);
        pts.push_back(pts_us);
        return true;
    }

    bool finish() override {
        finished = !fail_finish;
        return finished;
    }

    void abort() override {
        aborted = true;
        samples.clear();
    }

    std::string location() const override { return "memory://sink"; }
    std::string last_error() const override { return "sink refused"; }

    const spatializer::hal::SinkFormat& format() const { return format_; }

    bool fail_open = false;
    bool fail_finish = false;
    int fail_at_write = -1;

    bool opened = false;
    bool finished = false;
    bool aborted = false;
    std::vector<float> samples;
    std::vector<size_t> block_frames;
    std::vector<int64_t> pts;

private:
    spatializer::hal::SinkFormat format_;
};

/**
 * @brief Records every progress callback.
 */
struct ProgressLog {
    std::vector<int> percents;
    std::vector<spatializer::ProgressStage> stages;

    spatializer::ProgressCallback callback() {
        return [this](int percent, spatializer::ProgressStage stage) {
            percents.push_back(percent);
            stages.push_back(stage);
        };
    }
};

} // namespace test

#endif // SPATIALIZER_TEST_HELPER_HPP
