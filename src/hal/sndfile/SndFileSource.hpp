/**
 * @file SndFileSource.hpp
 * @brief libsndfile implementation of the FrameSource interface.
 */

#ifndef SPATIALIZER_SNDFILE_SOURCE_HPP
#define SPATIALIZER_SNDFILE_SOURCE_HPP

#include "FrameSource.hpp"
#include <sndfile.h>
#include <memory>
#include <string>

namespace spatializer::hal {

/**
 * @brief Decodes any container libsndfile reads (WAV, AIFF, FLAC, OGG ...).
 *
 * Samples arrive as float in [-1, 1] in the file's own channel layout.
 */
class SndFileSource : public FrameSource {
public:
    explicit SndFileSource(std::string path);
    ~SndFileSource() override;

    bool open() override;
    StreamFormat format() const override { return format_; }
    bool read(std::span<float> destination, size_t& frames_read) override;
    void close() override;
    std::string last_error() const override { return last_error_; }

    const std::string& path() const { return path_; }

private:
    struct Closer {
        void operator()(SNDFILE* file) const { sf_close(file); }
    };

    std::string path_;
    std::unique_ptr<SNDFILE, Closer> file_;
    StreamFormat format_;
    std::string last_error_;
};

} // namespace spatializer::hal

#endif // SPATIALIZER_SNDFILE_SOURCE_HPP
