#include "UpmixEngine.hpp"
#include <algorithm>

namespace spatializer {

namespace {

inline float clamp_unit(float x) {
    return std::clamp(x, -1.0f, 1.0f);
}

} // namespace

size_t upmix_binaural(const AudioFrame& frame, std::span<float> out) {
    const float mid = (frame.left + frame.right) * 0.5f;
    const float side = (frame.left - frame.right) * gains::kBinauralSide;
    out[0] = clamp_unit(mid + side);
    out[1] = clamp_unit(mid - side);
    return 2;
}

size_t upmix_surround51(const AudioFrame& frame, FilterBank* bank, bool immersive, std::span<float> out) {
    const float mid = (frame.left + frame.right) * 0.5f;
    const float rear_gain = gains::kRear * (immersive ? gains::kImmersiveRear : 1.0f);

    const float low = bank ? bank->lfe(mid) : mid;
    const float rear_l = bank ? bank->rear_left(frame.left) : frame.left;
    const float rear_r = bank ? bank->rear_right(frame.right) : frame.right;

    out[0] = clamp_unit(frame.left * gains::kFront);
    out[1] = clamp_unit(frame.right * gains::kFront);
    out[2] = clamp_unit(mid * gains::kCenter);
    out[3] = clamp_unit(low * gains::kLfe);
    out[4] = clamp_unit(rear_l * rear_gain);
    out[5] = clamp_unit(rear_r * rear_gain);
    return 6;
}

size_t upmix_surround71(const AudioFrame& frame, FilterBank* bank, std::span<float> out) {
    upmix_surround51(frame, bank, false, out);

    const float side_l = bank ? bank->side_left(frame.left) : frame.left;
    const float side_r = bank ? bank->side_right(frame.right) : frame.right;
    out[6] = clamp_unit(side_l * gains::kSide);
    out[7] = clamp_unit(side_r * gains::kSide);
    return 8;
}

size_t upmix_surround51_fast(const AudioFrame& frame, std::span<float> out) {
    const float l = frame.left;
    const float r = frame.right;
    const float width = (l - r) * 0.5f;

    out[0] = clamp_unit(l * 0.85f);
    out[1] = clamp_unit(r * 0.85f);
    out[2] = clamp_unit((l + r) * 0.45f);
    out[3] = clamp_unit((l + r) * 0.35f);
    out[4] = clamp_unit(l * 0.3f + width * 0.4f);
    out[5] = clamp_unit(r * 0.3f - width * 0.4f);
    return 6;
}

size_t process_frame(const AudioFrame& frame, OutputMode mode, FilterBank* bank, std::span<float> out) {
    switch (mode) {
        case OutputMode::Binaural:
            return upmix_binaural(frame, out);
        case OutputMode::Surround51:
            return upmix_surround51(frame, bank, false, out);
        case OutputMode::Surround51Immersive:
            return upmix_surround51(frame, bank, true, out);
        case OutputMode::Surround71:
            return upmix_surround71(frame, bank, out);
        case OutputMode::Surround51Fast:
            return upmix_surround51_fast(frame, out);
    }
    return 0;
}

OutputFrame process_frame(const AudioFrame& frame, OutputMode mode, FilterBank* bank) {
    OutputFrame result;
    result.channels = process_frame(frame, mode, bank, std::span<float>(result.samples));
    return result;
}

void process_frame_range(std::span<const float> stereo_in, std::span<float> out,
                         size_t begin, size_t end, OutputMode mode, FilterBank* bank) {
    const size_t channels = channel_count(mode);
    for (size_t i = begin; i < end; ++i) {
        process_frame(frame_at(stereo_in, i), mode, bank, out.subspan(i * channels, channels));
    }
}

} // namespace spatializer
