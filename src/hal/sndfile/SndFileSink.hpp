/**
 * @file SndFileSink.hpp
 * @brief libsndfile implementation of the FrameSink interface.
 */

#ifndef SPATIALIZER_SNDFILE_SINK_HPP
#define SPATIALIZER_SNDFILE_SINK_HPP

#include "FrameSink.hpp"
#include <sndfile.h>
#include <memory>
#include <string>
#include <vector>

namespace spatializer::hal {

enum class SampleEncoding {
    Pcm16,
    Float32
};

/**
 * @brief Writes WAVE_FORMAT_EXTENSIBLE files tagged with the mode's speaker layout.
 *
 * abort() closes the file and deletes it.
 */
class SndFileSink : public FrameSink {
public:
    explicit SndFileSink(std::string path, SampleEncoding encoding = SampleEncoding::Pcm16);
    ~SndFileSink() override;

    bool open(const SinkFormat& format) override;
    bool write(std::span<const float> interleaved, size_t frames, int64_t pts_us) override;
    bool finish() override;
    void abort() override;
    std::string location() const override { return path_; }
    std::string last_error() const override { return last_error_; }

    int64_t last_pts_us() const { return last_pts_us_; }

    /**
     * @brief libsndfile channel map for @p mode, one SF_CHANNEL_MAP_* per output channel.
     */
    static std::vector<int> channel_map(OutputMode mode);

private:
    struct Closer {
        void operator()(SNDFILE* file) const { sf_close(file); }
    };

    std::string path_;
    SampleEncoding encoding_;
    std::unique_ptr<SNDFILE, Closer> file_;
    SinkFormat format_;
    int64_t last_pts_us_ = -1;
    bool created_ = false;
    std::string last_error_;
};

} // namespace spatializer::hal

#endif // SPATIALIZER_SNDFILE_SINK_HPP
