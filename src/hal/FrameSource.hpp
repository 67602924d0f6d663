/**
 * @file FrameSource.hpp
 * @brief Abstract decode collaborator feeding PCM frames to the pipeline.
 *
 * Decoding code (libsndfile, test fakes) is kept apart from the DSP core;
 * the pipeline only sees this interface.
 */

#ifndef SPATIALIZER_FRAME_SOURCE_HPP
#define SPATIALIZER_FRAME_SOURCE_HPP

#include <span>
#include <string>
#include <cstddef>
#include <cstdint>

namespace spatializer::hal {

/**
 * @brief Format of a decoded stream.
 */
struct StreamFormat {
    int channels = 0;
    int sample_rate = 0;
    uint64_t total_frames = 0; // 0 when unknown

    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(total_frames) / sample_rate : 0.0;
    }
};

/**
 * @brief Delivers interleaved float frames in the source channel layout, in order.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * @brief Open the stream and make format() valid.
     *
     * @return true on success; on failure last_error() says why.
     */
    virtual bool open() = 0;

    virtual StreamFormat format() const = 0;

    /**
     * @brief Read up to destination.size() / channels frames.
     *
     * @param frames_read Frames actually read; 0 at end of stream.
     * @return false on a decode error.
     */
    virtual bool read(std::span<float> destination, size_t& frames_read) = 0;

    virtual void close() = 0;

    virtual std::string last_error() const = 0;
};

} // namespace spatializer::hal

#endif // SPATIALIZER_FRAME_SOURCE_HPP
