/**
 * @file UpmixEngine.hpp
 * @brief Per-frame stereo to binaural / 5.1 / 7.1 channel synthesis.
 */

#ifndef SPATIALIZER_UPMIX_ENGINE_HPP
#define SPATIALIZER_UPMIX_ENGINE_HPP

#include "AudioFrame.hpp"
#include "FilterBank.hpp"
#include "OutputMode.hpp"
#include <array>
#include <span>
#include <cstddef>

namespace spatializer {

namespace gains {
inline constexpr float kCenter = 0.9f;
inline constexpr float kFront = 0.9f;
inline constexpr float kLfe = 0.7f;
inline constexpr float kRear = 0.35f;
inline constexpr float kSide = 0.55f;
inline constexpr float kImmersiveRear = 1.8f;
inline constexpr float kBinauralSide = 0.6f;
} // namespace gains

/**
 * @brief One synthesized output frame. Only the first channels entries are meaningful.
 */
struct OutputFrame {
    std::array<float, kMaxOutputChannels> samples{};
    size_t channels = 0;

    size_t size() const { return channels; }
    float operator[](size_t index) const { return samples[index]; }
    std::span<const float> view() const { return std::span<const float>(samples.data(), channels); }
};

/**
 * @brief Synthesize one output frame into @p out.
 *
 * Filtered modes run their channels through @p bank; with a null bank they
 * fall back to the unfiltered signal at the same gains. Every sample written
 * is clamped to [-1, 1].
 *
 * @param out Destination, at least channel_count(mode) samples.
 * @return Number of samples written (channel_count(mode)).
 */
size_t process_frame(const AudioFrame& frame, OutputMode mode, FilterBank* bank, std::span<float> out);

/**
 * @brief Value-returning convenience form of process_frame().
 */
OutputFrame process_frame(const AudioFrame& frame, OutputMode mode, FilterBank* bank);

/**
 * @brief Upmix frames [begin, end) of interleaved stereo input into interleaved output.
 *
 * Output frame i is written at out[i * channel_count(mode)], so disjoint
 * frame ranges write disjoint output ranges.
 */
void process_frame_range(std::span<const float> stereo_in, std::span<float> out,
                         size_t begin, size_t end, OutputMode mode, FilterBank* bank);

size_t upmix_binaural(const AudioFrame& frame, std::span<float> out);
size_t upmix_surround51(const AudioFrame& frame, FilterBank* bank, bool immersive, std::span<float> out);
size_t upmix_surround71(const AudioFrame& frame, FilterBank* bank, std::span<float> out);
size_t upmix_surround51_fast(const AudioFrame& frame, std::span<float> out);

} // namespace spatializer

#endif // SPATIALIZER_UPMIX_ENGINE_HPP
