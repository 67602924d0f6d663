#include "StreamPipeline.hpp"
#include "ChunkScheduler.hpp"
#include "FilterBank.hpp"
#include "Logger.hpp"
#include "StereoCollapse.hpp"
#include "StereoResampler.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace spatializer {

StreamPipeline::StreamPipeline(PipelineConfig config, BufferPool& pool)
    : config_(config)
    , chunk_frames_(config.chunk_frames > 0 ? config.chunk_frames : default_chunk_frames(config.mode))
    , pool_(pool)
{
    config_.worker_count = std::max<size_t>(config_.worker_count, 1);
}

int64_t StreamPipeline::presentation_time_us(uint64_t frame_index, int sample_rate) {
    return static_cast<int64_t>(frame_index * 1'000'000ULL / static_cast<uint64_t>(sample_rate));
}

RunOutcome StreamPipeline::fail(hal::FrameSink& sink, std::string message) {
    std::cerr << "[StreamPipeline] " << message << std::endl;
    sink.abort();
    RunOutcome outcome;
    outcome.status = RunStatus::Failed;
    outcome.error = std::move(message);
    return outcome;
}

RunOutcome StreamPipeline::run(hal::FrameSource& source, hal::FrameSink& sink,
                               const CancellationToken& cancel, ProgressCallback progress) {
    ProgressReporter reporter(std::move(progress));
    reporter.report(0, ProgressStage::Preparing);

    if (!source.open()) {
        return fail(sink, "Cannot open source: " + source.last_error());
    }

    const hal::StreamFormat format = source.format();
    if (format.channels < 1 || format.sample_rate <= 0) {
        source.close();
        return fail(sink, "Unsupported source format");
    }

    const OutputMode mode = config_.mode;
    const int target_rate = config_.target_sample_rate;
    if (!FilterBank::supports_sample_rate(target_rate)) {
        source.close();
        return fail(sink, "Unsupported target sample rate: " + std::to_string(target_rate));
    }
    const size_t channels = channel_count(mode);
    const size_t source_channels = static_cast<size_t>(format.channels);

    hal::SinkFormat sink_format;
    sink_format.mode = mode;
    sink_format.channels = static_cast<int>(channels);
    sink_format.sample_rate = target_rate;
    if (!sink.open(sink_format)) {
        source.close();
        return fail(sink, "Cannot open sink: " + sink.last_error());
    }

    std::cout << "[StreamPipeline] " << mode_name(mode) << ": " << format.channels << " ch @ "
              << format.sample_rate << " Hz -> " << channels << " ch @ " << target_rate
              << " Hz, chunk " << chunk_frames_ << ", workers " << config_.worker_count << std::endl;

    uint64_t frames_consumed = 0;
    uint64_t frames_written = 0;

    try {
        ChunkScheduler scheduler(mode, target_rate, pool_, config_.worker_count);
        StereoResampler resampler(format.sample_rate, target_rate);
        const bool parallel = config_.worker_count > 1;

        auto source_block = pool_.borrow(chunk_frames_ * source_channels);
        auto stereo_block = pool_.borrow(chunk_frames_ * 2);
        auto chunk_in = pool_.borrow(chunk_frames_ * 2);
        std::vector<float> resampled;
        size_t filled = 0;

        auto emit = [&](size_t frames, bool sequential) -> bool {
            const std::span<const float> input = chunk_in->view(frames * 2);
            auto output = sequential ? scheduler.process_chunk_sequential(input, frames)
                                     : scheduler.process_chunk_parallel(input, frames);
            const int64_t pts = presentation_time_us(frames_written, target_rate);
            if (!sink.write(output->view(frames * channels), frames, pts)) {
                return false;
            }
            frames_written += frames;
            return true;
        };

        // Feed stereo frames into chunk_in, emitting every full chunk
        auto accumulate = [&](std::span<const float> stereo) -> bool {
            const size_t total = stereo.size() / 2;
            size_t offset = 0;
            while (offset < total) {
                const size_t take = std::min(chunk_frames_ - filled, total - offset);
                std::copy_n(stereo.begin() + offset * 2, take * 2, chunk_in->samples.begin() + filled * 2);
                filled += take;
                offset += take;
                if (filled == chunk_frames_) {
                    if (!emit(filled, !parallel)) {
                        return false;
                    }
                    filled = 0;
                }
            }
            return true;
        };

        reporter.report(0, ProgressStage::Converting);

        while (true) {
            if (cancel.is_cancelled()) {
                AudioLogger::instance().log_event("PIPE_CANCEL", static_cast<float>(frames_written));
                std::cout << "[StreamPipeline] Cancelled after " << frames_written << " frames" << std::endl;
                source.close();
                sink.abort();
                RunOutcome outcome;
                outcome.status = RunStatus::Cancelled;
                return outcome;
            }

            size_t frames_read = 0;
            if (!source.read(source_block->view(chunk_frames_ * source_channels), frames_read)) {
                source.close();
                return fail(sink, "Decode error: " + source.last_error());
            }
            if (frames_read == 0) {
                break;
            }
            frames_consumed += frames_read;

            const size_t stereo_frames = StereoCollapse::process(
                source_block->view(frames_read * source_channels), source_channels, frames_read,
                stereo_block->view(frames_read * 2));
            const std::span<const float> stereo = stereo_block->view(stereo_frames * 2);

            bool written = false;
            if (resampler.is_passthrough()) {
                written = accumulate(stereo);
            } else {
                resampled.clear();
                resampler.process(stereo, resampled);
                written = accumulate(resampled);
            }
            if (!written) {
                source.close();
                return fail(sink, "Encode error: " + sink.last_error());
            }

            reporter.report_frames(frames_consumed, format.total_frames);
        }

        source.close();

        if (filled > 0) {
            AudioLogger::instance().log_event("CHUNK_FRAMES", static_cast<float>(filled));
            if (!emit(filled, true)) {
                return fail(sink, "Encode error: " + sink.last_error());
            }
        }
    } catch (const std::exception& e) {
        source.close();
        return fail(sink, std::string("Processing failed: ") + e.what());
    }

    reporter.report(ProgressReporter::kFinalizingPercent, ProgressStage::Finalizing);
    if (!sink.finish()) {
        return fail(sink, "Cannot finalize output: " + sink.last_error());
    }
    reporter.report(ProgressReporter::kCompletePercent, ProgressStage::Complete);

    ProcessResult result;
    result.output_location = sink.location();
    result.sample_rate = target_rate;
    result.channel_count = channels;
    result.frame_count = frames_written;
    result.output_mode = mode;

    std::cout << "[StreamPipeline] Wrote " << frames_written << " frames to " << result.output_location << std::endl;

    RunOutcome outcome;
    outcome.status = RunStatus::Completed;
    outcome.result = result;
    return outcome;
}

} // namespace spatializer
