/**
 * @file StereoCollapse.hpp
 * @brief Reduces interleaved source audio of any channel count to interleaved stereo.
 */

#ifndef SPATIALIZER_STEREO_COLLAPSE_HPP
#define SPATIALIZER_STEREO_COLLAPSE_HPP

#include <span>
#include <algorithm>
#include <cstddef>

namespace spatializer {

/**
 * @brief Non-owning routing helper between a decoder and the upmix engine.
 *
 * Mono input is duplicated to both sides (L=R). Two or more channels keep
 * channels 0 and 1 and drop the rest.
 */
class StereoCollapse {
public:
    /**
     * @brief Collapse @p frames frames of @p channels-channel input.
     *
     * @param input Interleaved source samples.
     * @param stereo_output Interleaved stereo destination (2 samples per frame).
     * @return Number of frames written; limited by both spans.
     */
    static size_t process(std::span<const float> input, size_t channels, size_t frames,
                          std::span<float> stereo_output) {
        if (channels == 0) {
            return 0;
        }

        const size_t n = std::min({frames, input.size() / channels, stereo_output.size() / 2});

        if (channels == 1) {
            for (size_t i = 0; i < n; ++i) {
                const float sample = input[i];
                stereo_output[i * 2] = sample;
                stereo_output[i * 2 + 1] = sample;
            }
        } else {
            for (size_t i = 0; i < n; ++i) {
                stereo_output[i * 2] = input[i * channels];
                stereo_output[i * 2 + 1] = input[i * channels + 1];
            }
        }
        return n;
    }
};

} // namespace spatializer

#endif // SPATIALIZER_STEREO_COLLAPSE_HPP
