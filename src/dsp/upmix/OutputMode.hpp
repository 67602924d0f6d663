/**
 * @file OutputMode.hpp
 * @brief Output modes and the channel layout each one fixes.
 */

#ifndef SPATIALIZER_OUTPUT_MODE_HPP
#define SPATIALIZER_OUTPUT_MODE_HPP

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <cstddef>

namespace spatializer {

enum class OutputMode {
    Binaural,
    Surround51,
    Surround51Immersive,
    Surround71,
    Surround51Fast
};

inline constexpr std::array<OutputMode, 5> kAllOutputModes = {
    OutputMode::Binaural,
    OutputMode::Surround51,
    OutputMode::Surround51Immersive,
    OutputMode::Surround71,
    OutputMode::Surround51Fast
};

/**
 * @brief Speaker positions, in the order they appear in an output frame.
 */
enum class Channel {
    Left,
    Right,
    FrontLeft,
    FrontRight,
    Center,
    Lfe,
    BackLeft,
    BackRight,
    SideLeft,
    SideRight
};

inline constexpr size_t kMaxOutputChannels = 8;

/**
 * @brief Number of interleaved channels in an output frame: 2, 6 or 8.
 */
size_t channel_count(OutputMode mode);

/**
 * @brief Ordered channel layout of an output frame.
 */
std::span<const Channel> channel_layout(OutputMode mode);

/**
 * @brief True for the modes that shape channels with a FilterBank.
 */
bool uses_filters(OutputMode mode);

/**
 * @brief Frames per scheduling chunk for @p mode.
 */
size_t default_chunk_frames(OutputMode mode);

/**
 * @brief Short label used in file names and settings ("51ch", "fast", ...).
 */
std::string_view mode_label(OutputMode mode);

/**
 * @brief Enum-style name ("Surround51", ...).
 */
std::string_view mode_name(OutputMode mode);

std::string_view channel_name(Channel channel);

/**
 * @brief Parse a mode from its label or its name (case-sensitive).
 */
std::optional<OutputMode> parse_output_mode(std::string_view text);

} // namespace spatializer

#endif // SPATIALIZER_OUTPUT_MODE_HPP
