/**
 * @file StereoResampler.hpp
 * @brief Streaming linear-interpolation sample rate converter for interleaved stereo.
 */

#ifndef SPATIALIZER_STEREO_RESAMPLER_HPP
#define SPATIALIZER_STEREO_RESAMPLER_HPP

#include "AudioFrame.hpp"
#include <span>
#include <vector>
#include <cstddef>

namespace spatializer {

/**
 * @brief Converts a stereo stream from one rate to another block by block.
 *
 * The read position is carried across blocks, so splitting the input into
 * blocks of any size yields the same output as converting it in one piece.
 * The last input frame of every block is kept as the left neighbour of the
 * next block's first frame.
 */
class StereoResampler {
public:
    StereoResampler(int input_rate, int output_rate)
        : input_rate_(input_rate)
        , output_rate_(output_rate)
        , step_(static_cast<double>(input_rate) / static_cast<double>(output_rate))
    {}

    /**
     * @brief True when the rates match and process() would only copy.
     */
    bool is_passthrough() const { return input_rate_ == output_rate_; }

    int input_rate() const { return input_rate_; }
    int output_rate() const { return output_rate_; }

    /**
     * @brief Convert one block and append the result to @p output.
     *
     * @param input Interleaved stereo samples.
     * @return Number of stereo frames appended.
     */
    size_t process(std::span<const float> input, std::vector<float>& output) {
        const size_t frames = input.size() / 2;
        if (frames == 0) {
            return 0;
        }

        if (is_passthrough()) {
            output.insert(output.end(), input.begin(), input.begin() + frames * 2);
            return frames;
        }

        size_t first = 0;
        if (!primed_) {
            previous_ = frame_at(input, 0);
            primed_ = true;
            first = 1;
        }

        // Index 0 is previous_, index k >= 1 is input frame first + k - 1
        const size_t fresh = frames - first;
        size_t produced = 0;
        while (position_ < static_cast<double>(fresh)) {
            const size_t i0 = static_cast<size_t>(position_);
            const float frac = static_cast<float>(position_ - static_cast<double>(i0));

            const AudioFrame a = (i0 == 0) ? previous_ : frame_at(input, first + i0 - 1);
            const AudioFrame b = frame_at(input, first + i0);

            output.push_back(a.left + frac * (b.left - a.left));
            output.push_back(a.right + frac * (b.right - a.right));

            position_ += step_;
            ++produced;
        }

        if (fresh > 0) {
            position_ -= static_cast<double>(fresh);
            previous_ = frame_at(input, frames - 1);
        }
        return produced;
    }

    void reset() {
        position_ = 0.0;
        previous_ = AudioFrame{};
        primed_ = false;
    }

private:
    int input_rate_;
    int output_rate_;
    double step_;
    double position_ = 0.0;
    AudioFrame previous_{};
    bool primed_ = false;
};

} // namespace spatializer

#endif // SPATIALIZER_STEREO_RESAMPLER_HPP
