/**
 * @file AudioBridge.cpp
 * @brief C-compatible API bridge for the upmixer and the file conversion pipeline.
 */

#include "CInterface.h"
#include "BufferPool.hpp"
#include "ChunkScheduler.hpp"
#include "FilterBank.hpp"
#include "OutputMode.hpp"
#include "ProgressReporter.hpp"
#include "StreamPipeline.hpp"
#include "sndfile/SndFileSink.hpp"
#include "sndfile/SndFileSource.hpp"
#include <exception>
#include <iostream>
#include <limits>
#include <memory>
#include <span>

namespace {

// Internal handle structure (hidden from C API)
struct UpmixerHandleImpl {
    spatializer::OutputMode mode;
    int sample_rate;
    size_t worker_count;
    spatializer::BufferPool pool;
    spatializer::ChunkScheduler scheduler;
    spatializer::CancellationToken cancel;

    UpmixerHandleImpl(spatializer::OutputMode m, int sr, size_t workers)
        : mode(m)
        , sample_rate(sr)
        , worker_count(workers)
        , scheduler(m, sr, pool, workers)
    {
    }
};

int report_failure(const char* function, const std::exception& e) {
    std::cerr << "[AudioBridge] " << function << ": " << e.what() << std::endl;
    return SPATIALIZER_ERROR;
}

spatializer::OutputMode to_mode(int mode) {
    return spatializer::kAllOutputModes[static_cast<size_t>(mode)];
}

} // namespace

extern "C" {

UpmixerHandle upmixer_create(int mode, unsigned int sample_rate, unsigned int worker_count) {
    if (mode < SPATIALIZER_MODE_BINAURAL || mode > SPATIALIZER_MODE_SURROUND51_FAST) {
        return nullptr;
    }
    if (sample_rate > static_cast<unsigned int>(std::numeric_limits<int>::max())
        || !spatializer::FilterBank::supports_sample_rate(static_cast<int>(sample_rate))) {
        std::cerr << "[AudioBridge] upmixer_create: unsupported sample rate " << sample_rate << std::endl;
        return nullptr;
    }
    try {
        const size_t workers = worker_count == 0 ? spatializer::ChunkScheduler::kDefaultWorkers : worker_count;
        return static_cast<UpmixerHandle>(new UpmixerHandleImpl(to_mode(mode), static_cast<int>(sample_rate), workers));
    } catch (const std::exception& e) {
        report_failure("upmixer_create", e);
        return nullptr;
    }
}

void upmixer_destroy(UpmixerHandle handle) {
    if (handle) {
        delete static_cast<UpmixerHandleImpl*>(handle);
    }
}

int upmixer_channel_count(UpmixerHandle handle) {
    if (!handle) return -1;
    auto* impl = static_cast<UpmixerHandleImpl*>(handle);
    return static_cast<int>(spatializer::channel_count(impl->mode));
}

int upmixer_process(UpmixerHandle handle, const float* stereo_input, float* output, size_t frames) {
    if (!handle || !stereo_input || !output) return -1;
    if (frames == 0) return 0;
    auto* impl = static_cast<UpmixerHandleImpl*>(handle);
    const size_t channels = spatializer::channel_count(impl->mode);
    impl->scheduler.process_sequential_into(std::span<const float>(stereo_input, frames * 2), frames,
                                            std::span<float>(output, frames * channels));
    return 0;
}

int upmixer_process_parallel(UpmixerHandle handle, const float* stereo_input, float* output, size_t frames) {
    if (!handle || !stereo_input || !output) return -1;
    if (frames == 0) return 0;
    auto* impl = static_cast<UpmixerHandleImpl*>(handle);
    try {
        const size_t channels = spatializer::channel_count(impl->mode);
        impl->scheduler.process_parallel_into(std::span<const float>(stereo_input, frames * 2), frames,
                                              std::span<float>(output, frames * channels));
        return 0;
    } catch (const std::exception& e) {
        // Thread creation failure
        return report_failure("upmixer_process_parallel", e);
    }
}

int upmixer_reset(UpmixerHandle handle) {
    if (!handle) return -1;
    static_cast<UpmixerHandleImpl*>(handle)->scheduler.reset();
    return 0;
}

int upmixer_get_metrics(UpmixerHandle handle,
                        uint64_t* last_time_ns,
                        uint64_t* max_time_ns,
                        uint64_t* total_blocks) {
    if (!handle || !last_time_ns || !max_time_ns || !total_blocks) return -1;
    const auto& profiler = static_cast<UpmixerHandleImpl*>(handle)->scheduler.profiler();
    *last_time_ns = static_cast<uint64_t>(profiler.elapsed().count());
    *max_time_ns = static_cast<uint64_t>(profiler.max_execution_time().count());
    *total_blocks = static_cast<uint64_t>(profiler.total_blocks_processed());
    return 0;
}

int upmixer_convert_file(UpmixerHandle handle, const char* input_path, const char* output_path,
                         int float_output, SpatializerProgressFn callback, void* user_data) {
    if (!handle || !input_path || !output_path) return SPATIALIZER_ERROR;
    auto* impl = static_cast<UpmixerHandleImpl*>(handle);
    try {
        impl->cancel.reset();

        spatializer::PipelineConfig config;
        config.mode = impl->mode;
        config.worker_count = impl->worker_count;

        spatializer::hal::SndFileSource source(input_path);
        spatializer::hal::SndFileSink sink(output_path, float_output ? spatializer::hal::SampleEncoding::Float32
                                                                     : spatializer::hal::SampleEncoding::Pcm16);

        spatializer::ProgressCallback progress;
        if (callback) {
            progress = [callback, user_data](int percent, spatializer::ProgressStage stage) {
                callback(percent, static_cast<int>(stage), user_data);
            };
        }

        spatializer::StreamPipeline pipeline(config, impl->pool);
        const auto outcome = pipeline.run(source, sink, impl->cancel, progress);
        switch (outcome.status) {
            case spatializer::RunStatus::Completed: return SPATIALIZER_OK;
            case spatializer::RunStatus::Cancelled: return SPATIALIZER_CANCELLED;
            case spatializer::RunStatus::Failed: return SPATIALIZER_ERROR;
        }
        return SPATIALIZER_ERROR;
    } catch (const std::exception& e) {
        return report_failure("upmixer_convert_file", e);
    }
}

void upmixer_cancel(UpmixerHandle handle) {
    if (handle) {
        static_cast<UpmixerHandleImpl*>(handle)->cancel.cancel();
    }
}

} // extern "C"
