#include "SndFileSource.hpp"
#include <iostream>
#include <utility>

namespace spatializer::hal {

SndFileSource::SndFileSource(std::string path)
    : path_(std::move(path))
{
}

SndFileSource::~SndFileSource() {
    close();
}

bool SndFileSource::open() {
    if (file_) {
        return true;
    }

    SF_INFO info{};
    file_.reset(sf_open(path_.c_str(), SFM_READ, &info));
    if (!file_) {
        last_error_ = sf_strerror(nullptr);
        std::cerr << "[SndFileSource] Cannot open " << path_ << ": " << last_error_ << std::endl;
        return false;
    }

    format_.channels = info.channels;
    format_.sample_rate = info.samplerate;
    format_.total_frames = info.frames > 0 ? static_cast<uint64_t>(info.frames) : 0;

    std::cout << "[SndFileSource] " << path_ << ": " << format_.channels << " ch, "
              << format_.sample_rate << " Hz, " << format_.total_frames << " frames" << std::endl;
    return true;
}

bool SndFileSource::read(std::span<float> destination, size_t& frames_read) {
    frames_read = 0;
    if (!file_) {
        last_error_ = "source is not open";
        return false;
    }

    const auto channels = static_cast<size_t>(format_.channels);
    const auto wanted = static_cast<sf_count_t>(destination.size() / channels);
    if (wanted == 0) {
        return true;
    }

    const sf_count_t got = sf_readf_float(file_.get(), destination.data(), wanted);
    if (got < 0 || (got == 0 && sf_error(file_.get()) != SF_ERR_NO_ERROR)) {
        last_error_ = sf_strerror(file_.get());
        return false;
    }
    frames_read = static_cast<size_t>(got);
    return true;
}

void SndFileSource::close() {
    file_.reset();
}

} // namespace spatializer::hal
