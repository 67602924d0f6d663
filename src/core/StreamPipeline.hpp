/**
 * @file StreamPipeline.hpp
 * @brief Decode -> chunk -> upmix -> encode orchestration for one stream.
 */

#ifndef SPATIALIZER_STREAM_PIPELINE_HPP
#define SPATIALIZER_STREAM_PIPELINE_HPP

#include "BufferPool.hpp"
#include "OutputMode.hpp"
#include "ProgressReporter.hpp"
#include "FrameSource.hpp"
#include "FrameSink.hpp"
#include <optional>
#include <string>
#include <cstddef>
#include <cstdint>

namespace spatializer {

inline constexpr int kTargetSampleRate = 44100;

struct PipelineConfig {
    OutputMode mode = OutputMode::Surround51;
    size_t worker_count = 2;   // 1 runs every chunk sequentially
    size_t chunk_frames = 0;   // 0 picks default_chunk_frames(mode)
    int target_sample_rate = kTargetSampleRate;
};

/**
 * @brief Summary of a completed conversion.
 */
struct ProcessResult {
    std::string output_location;
    int sample_rate = 0;
    size_t channel_count = 0;
    uint64_t frame_count = 0;
    OutputMode output_mode = OutputMode::Surround51;
};

enum class RunStatus {
    Completed,
    Cancelled,
    Failed
};

struct RunOutcome {
    RunStatus status = RunStatus::Failed;
    std::optional<ProcessResult> result; // set only when Completed
    std::string error;

    bool ok() const { return status == RunStatus::Completed; }
};

/**
 * @brief Runs one stream from a FrameSource to a FrameSink.
 *
 * Source frames are collapsed to stereo, resampled to the target rate when
 * needed and gathered into fixed-size chunks. Full chunks go through the
 * parallel scheduler (or the sequential one with a single worker); the
 * trailing partial chunk always goes through the sequential path. Output is
 * written in input order with timestamps derived from the cumulative frame
 * count. Cancellation is honoured between chunks only. On failure or
 * cancellation the sink is aborted.
 */
class StreamPipeline {
public:
    StreamPipeline(PipelineConfig config, BufferPool& pool);

    RunOutcome run(hal::FrameSource& source, hal::FrameSink& sink,
                   const CancellationToken& cancel, ProgressCallback progress = {});

    const PipelineConfig& config() const { return config_; }
    size_t chunk_frames() const { return chunk_frames_; }

    /**
     * @brief Presentation time in microseconds of the frame at @p frame_index.
     */
    static int64_t presentation_time_us(uint64_t frame_index, int sample_rate);

private:
    RunOutcome fail(hal::FrameSink& sink, std::string message);

    PipelineConfig config_;
    size_t chunk_frames_;
    BufferPool& pool_;
};

} // namespace spatializer

#endif // SPATIALIZER_STREAM_PIPELINE_HPP
