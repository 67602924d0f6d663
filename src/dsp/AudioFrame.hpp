/**
 * @file AudioFrame.hpp
 * @brief Stereo frame type and interleaved access.
 */

#ifndef SPATIALIZER_AUDIO_FRAME_HPP
#define SPATIALIZER_AUDIO_FRAME_HPP

#include <span>
#include <cstddef>

namespace spatializer {

/**
 * @brief One stereo frame of normalized samples in [-1, 1].
 */
struct AudioFrame {
    float left = 0.0f;
    float right = 0.0f;
};

/**
 * @brief Read frame @p index from an interleaved stereo span.
 */
inline AudioFrame frame_at(std::span<const float> interleaved_stereo, size_t index) {
    return AudioFrame{interleaved_stereo[index * 2], interleaved_stereo[index * 2 + 1]};
}

} // namespace spatializer

#endif // SPATIALIZER_AUDIO_FRAME_HPP
