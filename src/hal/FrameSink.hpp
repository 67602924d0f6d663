/**
 * @file FrameSink.hpp
 * @brief Abstract encode collaborator consuming multichannel frames.
 */

#ifndef SPATIALIZER_FRAME_SINK_HPP
#define SPATIALIZER_FRAME_SINK_HPP

#include "OutputMode.hpp"
#include <span>
#include <string>
#include <cstddef>
#include <cstdint>

namespace spatializer::hal {

/**
 * @brief Format the sink is opened with; channels always matches the mode.
 */
struct SinkFormat {
    OutputMode mode = OutputMode::Surround51;
    int channels = 6;
    int sample_rate = 44100;
};

/**
 * @brief Receives interleaved output frames with increasing timestamps.
 *
 * Lifecycle: open() once, write() any number of times, then exactly one of
 * finish() (keep the output) or abort() (discard it).
 */
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual bool open(const SinkFormat& format) = 0;

    /**
     * @param interleaved frames * channels samples.
     * @param pts_us Presentation time of the first frame in microseconds.
     */
    virtual bool write(std::span<const float> interleaved, size_t frames, int64_t pts_us) = 0;

    /**
     * @brief Drain and close. The output is complete afterwards.
     */
    virtual bool finish() = 0;

    /**
     * @brief Close and discard everything written. Safe to call in any state.
     */
    virtual void abort() = 0;

    /**
     * @brief Where the output ends up (file path, device name).
     */
    virtual std::string location() const = 0;

    virtual std::string last_error() const = 0;
};

} // namespace spatializer::hal

#endif // SPATIALIZER_FRAME_SINK_HPP
