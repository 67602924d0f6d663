#include "SndFileSink.hpp"
#include <filesystem>
#include <iostream>
#include <utility>

namespace spatializer::hal {

namespace {

int sf_channel(Channel channel) {
    switch (channel) {
        case Channel::Left:
        case Channel::FrontLeft: return SF_CHANNEL_MAP_LEFT;
        case Channel::Right:
        case Channel::FrontRight: return SF_CHANNEL_MAP_RIGHT;
        case Channel::Center: return SF_CHANNEL_MAP_CENTER;
        case Channel::Lfe: return SF_CHANNEL_MAP_LFE;
        case Channel::BackLeft: return SF_CHANNEL_MAP_REAR_LEFT;
        case Channel::BackRight: return SF_CHANNEL_MAP_REAR_RIGHT;
        case Channel::SideLeft: return SF_CHANNEL_MAP_SIDE_LEFT;
        case Channel::SideRight: return SF_CHANNEL_MAP_SIDE_RIGHT;
    }
    return SF_CHANNEL_MAP_INVALID;
}

} // namespace

SndFileSink::SndFileSink(std::string path, SampleEncoding encoding)
    : path_(std::move(path))
    , encoding_(encoding)
{
}

SndFileSink::~SndFileSink() {
    file_.reset();
}

std::vector<int> SndFileSink::channel_map(OutputMode mode) {
    std::vector<int> map;
    for (Channel channel : channel_layout(mode)) {
        map.push_back(sf_channel(channel));
    }
    return map;
}

bool SndFileSink::open(const SinkFormat& format) {
    format_ = format;

    SF_INFO info{};
    info.samplerate = format.sample_rate;
    info.channels = format.channels;
    info.format = SF_FORMAT_WAVEX | (encoding_ == SampleEncoding::Float32 ? SF_FORMAT_FLOAT : SF_FORMAT_PCM_16);

    if (!sf_format_check(&info)) {
        last_error_ = "unsupported output format";
        return false;
    }

    file_.reset(sf_open(path_.c_str(), SFM_WRITE, &info));
    if (!file_) {
        last_error_ = sf_strerror(nullptr);
        std::cerr << "[SndFileSink] Cannot create " << path_ << ": " << last_error_ << std::endl;
        return false;
    }
    created_ = true;

    auto map = channel_map(format.mode);
    if (sf_command(file_.get(), SFC_SET_CHANNEL_MAP_INFO, map.data(),
                   static_cast<int>(map.size() * sizeof(int))) != SF_TRUE) {
        // The samples are still correct; only the speaker tags are missing
        std::cerr << "[SndFileSink] Channel map not stored for " << path_ << std::endl;
    }
    sf_command(file_.get(), SFC_SET_CLIPPING, nullptr, SF_TRUE);

    std::cout << "[SndFileSink] Writing " << path_ << " (" << format.channels << " ch, "
              << format.sample_rate << " Hz, " << mode_name(format.mode) << ")" << std::endl;
    return true;
}

bool SndFileSink::write(std::span<const float> interleaved, size_t frames, int64_t pts_us) {
    if (!file_) {
        last_error_ = "sink is not open";
        return false;
    }
    if (pts_us <= last_pts_us_) {
        last_error_ = "presentation time went backwards";
        return false;
    }

    const auto channels = static_cast<size_t>(format_.channels);
    if (interleaved.size() < frames * channels) {
        last_error_ = "short output block";
        return false;
    }

    const sf_count_t written = sf_writef_float(file_.get(), interleaved.data(), static_cast<sf_count_t>(frames));
    if (written != static_cast<sf_count_t>(frames)) {
        last_error_ = sf_strerror(file_.get());
        return false;
    }
    last_pts_us_ = pts_us;
    return true;
}

bool SndFileSink::finish() {
    if (!file_) {
        last_error_ = "sink is not open";
        return false;
    }
    sf_write_sync(file_.get());
    const int err = sf_close(file_.release());
    if (err != 0) {
        last_error_ = sf_error_number(err);
        return false;
    }
    return true;
}

void SndFileSink::abort() {
    file_.reset();
    if (!created_) {
        return;
    }
    created_ = false;

    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        std::cerr << "[SndFileSink] Cannot remove partial output " << path_ << ": " << ec.message() << std::endl;
    } else {
        std::cout << "[SndFileSink] Discarded " << path_ << std::endl;
    }
}

} // namespace spatializer::hal
