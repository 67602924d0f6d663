/**
 * @file OutputMode.cpp
 * @brief Channel layouts and naming for the output modes.
 */

#include "OutputMode.hpp"

namespace spatializer {

namespace {

constexpr std::array<Channel, 2> kStereoLayout = {
    Channel::Left, Channel::Right
};

constexpr std::array<Channel, 6> kSurround51Layout = {
    Channel::FrontLeft, Channel::FrontRight, Channel::Center,
    Channel::Lfe, Channel::BackLeft, Channel::BackRight
};

constexpr std::array<Channel, 8> kSurround71Layout = {
    Channel::FrontLeft, Channel::FrontRight, Channel::Center,
    Channel::Lfe, Channel::BackLeft, Channel::BackRight,
    Channel::SideLeft, Channel::SideRight
};

} // namespace

size_t channel_count(OutputMode mode) {
    return channel_layout(mode).size();
}

std::span<const Channel> channel_layout(OutputMode mode) {
    switch (mode) {
        case OutputMode::Binaural:
            return kStereoLayout;
        case OutputMode::Surround71:
            return kSurround71Layout;
        case OutputMode::Surround51:
        case OutputMode::Surround51Immersive:
        case OutputMode::Surround51Fast:
            break;
    }
    return kSurround51Layout;
}

bool uses_filters(OutputMode mode) {
    return mode == OutputMode::Surround51
        || mode == OutputMode::Surround51Immersive
        || mode == OutputMode::Surround71;
}

size_t default_chunk_frames(OutputMode mode) {
    return mode == OutputMode::Surround51Fast ? 4096 : 2048;
}

std::string_view mode_label(OutputMode mode) {
    switch (mode) {
        case OutputMode::Binaural: return "binaural";
        case OutputMode::Surround51: return "51ch";
        case OutputMode::Surround51Immersive: return "quality";
        case OutputMode::Surround71: return "71ch";
        case OutputMode::Surround51Fast: return "fast";
    }
    return "51ch";
}

std::string_view mode_name(OutputMode mode) {
    switch (mode) {
        case OutputMode::Binaural: return "Binaural";
        case OutputMode::Surround51: return "Surround51";
        case OutputMode::Surround51Immersive: return "Surround51Immersive";
        case OutputMode::Surround71: return "Surround71";
        case OutputMode::Surround51Fast: return "Surround51Fast";
    }
    return "Surround51";
}

std::string_view channel_name(Channel channel) {
    switch (channel) {
        case Channel::Left: return "L";
        case Channel::Right: return "R";
        case Channel::FrontLeft: return "FL";
        case Channel::FrontRight: return "FR";
        case Channel::Center: return "C";
        case Channel::Lfe: return "LFE";
        case Channel::BackLeft: return "BL";
        case Channel::BackRight: return "BR";
        case Channel::SideLeft: return "SL";
        case Channel::SideRight: return "SR";
    }
    return "?";
}

std::optional<OutputMode> parse_output_mode(std::string_view text) {
    for (OutputMode mode : kAllOutputModes) {
        if (text == mode_label(mode) || text == mode_name(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

} // namespace spatializer
