/**
 * @file AlsaPlaybackSink.cpp
 * @brief Linux ALSA implementation of the FrameSink interface.
 */

#include "AlsaPlaybackSink.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

namespace spatializer::hal {

int32_t sample_to_s32(float sample) {
    if (std::isnan(sample)) {
        return 0;
    }
    // 1.0f * 2147483647.0f rounds to 2^31 in float, so scale in double
    const double scaled = static_cast<double>(std::clamp(sample, -1.0f, 1.0f)) * 2147483647.0;
    return static_cast<int32_t>(std::lround(scaled));
}

int16_t sample_to_s16(float sample) {
    if (std::isnan(sample)) {
        return 0;
    }
    return static_cast<int16_t>(std::lround(std::clamp(sample, -1.0f, 1.0f) * 32767.0f));
}

AlsaPlaybackSink::AlsaPlaybackSink(std::string device, int period_frames)
    : pcm_handle_(nullptr)
    , device_name_(std::move(device))
    , sample_rate_(0)
    , period_frames_(period_frames)
    , channels_(0)
    , use_s32_(true)
    , xruns_(0)
{
}

AlsaPlaybackSink::~AlsaPlaybackSink() {
    close_pcm();
}

bool AlsaPlaybackSink::fail(const char* what, int err) {
    last_error_ = std::string(what) + " (" + snd_strerror(err) + ")";
    std::cerr << "ALSA: " << last_error_ << std::endl;
    close_pcm();
    return false;
}

bool AlsaPlaybackSink::open(const SinkFormat& format) {
    if (pcm_handle_) {
        close_pcm();
    }
    return setup_pcm(format);
}

bool AlsaPlaybackSink::setup_pcm(const SinkFormat& format) {
    int err;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        pcm_handle_ = nullptr;
        return fail("Cannot open audio device", err);
    }

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params)) < 0) {
        return fail("Cannot initialize hardware parameter structure", err);
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        return fail("Cannot set access type", err);
    }

    use_s32_ = true;
    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, SND_PCM_FORMAT_S32_LE)) < 0) {
        std::cerr << "ALSA: Cannot set S32_LE, falling back to S16_LE" << std::endl;
        use_s32_ = false;
        if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, SND_PCM_FORMAT_S16_LE)) < 0) {
            return fail("Cannot set sample format", err);
        }
    }

    unsigned int rate = static_cast<unsigned int>(format.sample_rate);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params, &rate, nullptr)) < 0) {
        return fail("Cannot set sample rate", err);
    }
    sample_rate_ = static_cast<int>(rate);
    if (sample_rate_ != format.sample_rate) {
        std::cerr << "ALSA: Device runs at " << sample_rate_ << " Hz instead of "
                  << format.sample_rate << " Hz" << std::endl;
    }

    // The channel layout is fixed by the mode, so no _near here
    if ((err = snd_pcm_hw_params_set_channels(pcm_handle_, hw_params, static_cast<unsigned int>(format.channels))) < 0) {
        return fail("Cannot set channel count", err);
    }
    channels_ = format.channels;

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(period_frames_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params, &frames, nullptr)) < 0) {
        return fail("Cannot set period size", err);
    }
    period_frames_ = static_cast<int>(frames);

    unsigned int periods = 4;
    snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params, &periods, nullptr);

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params)) < 0) {
        return fail("Cannot set parameters", err);
    }

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        return fail("Cannot prepare audio interface for use", err);
    }

    xruns_ = 0;
    std::cout << "[AlsaPlaybackSink] " << device_name_ << ": " << channels_ << " ch @ " << sample_rate_
              << " Hz, " << (use_s32_ ? "S32_LE" : "S16_LE") << ", period " << period_frames_ << std::endl;
    return true;
}

bool AlsaPlaybackSink::write(std::span<const float> interleaved, size_t frames, int64_t /* pts_us */) {
    if (!pcm_handle_) {
        last_error_ = "sink is not open";
        return false;
    }

    const size_t samples = frames * static_cast<size_t>(channels_);
    if (interleaved.size() < samples) {
        last_error_ = "short output block";
        return false;
    }

    const void* data;
    if (use_s32_) {
        s32_buffer_.resize(samples);
        for (size_t i = 0; i < samples; ++i) {
            s32_buffer_[i] = sample_to_s32(interleaved[i]);
        }
        data = s32_buffer_.data();
    } else {
        s16_buffer_.resize(samples);
        for (size_t i = 0; i < samples; ++i) {
            s16_buffer_[i] = sample_to_s16(interleaved[i]);
        }
        data = s16_buffer_.data();
    }

    const size_t bytes_per_frame = static_cast<size_t>(channels_) * (use_s32_ ? sizeof(int32_t) : sizeof(int16_t));
    size_t offset = 0;
    while (offset < frames) {
        const auto* cursor = static_cast<const uint8_t*>(data) + offset * bytes_per_frame;
        const snd_pcm_sframes_t n = snd_pcm_writei(pcm_handle_, cursor, frames - offset);
        if (n < 0) {
            if (!recover_pcm(static_cast<int>(n))) {
                last_error_ = std::string("Write failed (") + snd_strerror(static_cast<int>(n)) + ")";
                return false;
            }
            continue;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

bool AlsaPlaybackSink::recover_pcm(int err) {
    if (err == -EPIPE) {
        ++xruns_;
        AudioLogger::instance().log_event("ALSA_XRUN", static_cast<float>(xruns_));
        return snd_pcm_prepare(pcm_handle_) >= 0;
    }
    if (err == -ESTRPIPE) {
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (err < 0) {
            return snd_pcm_prepare(pcm_handle_) >= 0;
        }
        return true;
    }
    if (err == -EAGAIN || err == -EINTR) {
        return true;
    }
    return false;
}

bool AlsaPlaybackSink::finish() {
    if (!pcm_handle_) {
        last_error_ = "sink is not open";
        return false;
    }
    const int err = snd_pcm_drain(pcm_handle_);
    close_pcm();
    if (err < 0) {
        last_error_ = std::string("Drain failed (") + snd_strerror(err) + ")";
        return false;
    }
    return true;
}

void AlsaPlaybackSink::abort() {
    if (pcm_handle_) {
        snd_pcm_drop(pcm_handle_);
    }
    close_pcm();
}

void AlsaPlaybackSink::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

} // namespace spatializer::hal
