/**
 * @file AlsaPlaybackSink.hpp
 * @brief Linux ALSA implementation of the FrameSink interface for real-time playback.
 */

#ifndef SPATIALIZER_ALSA_PLAYBACK_SINK_HPP
#define SPATIALIZER_ALSA_PLAYBACK_SINK_HPP

#include "FrameSink.hpp"
#include <alsa/asoundlib.h>
#include <cstdint>
#include <string>
#include <vector>

namespace spatializer::hal {

/**
 * @brief Convert a normalized sample to S32_LE. Values outside [-1, 1] saturate, NaN maps to 0.
 */
int32_t sample_to_s32(float sample);

/**
 * @brief Convert a normalized sample to S16_LE. Values outside [-1, 1] saturate, NaN maps to 0.
 */
int16_t sample_to_s16(float sample);

/**
 * @brief Streams upmixed frames to an ALSA PCM device.
 *
 * Opens with the mode's channel count, interleaved RW access, S32_LE and
 * S16_LE as fallback. write() blocks until ALSA accepted every frame and
 * recovers from underruns on its own.
 */
class AlsaPlaybackSink : public FrameSink {
public:
    /**
     * @param device ALSA device name.
     * @param period_frames Requested period size (frames per interrupt).
     */
    explicit AlsaPlaybackSink(std::string device = "default", int period_frames = 512);
    ~AlsaPlaybackSink() override;

    bool open(const SinkFormat& format) override;
    bool write(std::span<const float> interleaved, size_t frames, int64_t pts_us) override;
    bool finish() override;
    void abort() override;
    std::string location() const override { return device_name_; }
    std::string last_error() const override { return last_error_; }

    int sample_rate() const { return sample_rate_; }
    int period_frames() const { return period_frames_; }
    size_t xrun_count() const { return xruns_; }

private:
    bool setup_pcm(const SinkFormat& format);
    bool recover_pcm(int err);
    void close_pcm();
    bool fail(const char* what, int err);

    snd_pcm_t* pcm_handle_;
    std::string device_name_;
    int sample_rate_;
    int period_frames_;
    int channels_;
    bool use_s32_;
    size_t xruns_;
    std::vector<int32_t> s32_buffer_;
    std::vector<int16_t> s16_buffer_;
    std::string last_error_;
};

} // namespace spatializer::hal

#endif // SPATIALIZER_ALSA_PLAYBACK_SINK_HPP
