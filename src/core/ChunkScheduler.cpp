#include "ChunkScheduler.hpp"
#include "Logger.hpp"
#include "UpmixEngine.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace spatializer {

ChunkScheduler::ChunkScheduler(OutputMode mode, int sample_rate, BufferPool& pool, size_t worker_count)
    : mode_(mode)
    , channels_(channel_count(mode))
    , pool_(pool)
    , sequential_bank_(sample_rate)
    , worker_banks_(std::max<size_t>(worker_count, 1), FilterBank(sample_rate))
{
}

std::vector<FrameRange> ChunkScheduler::partition(size_t frames, size_t workers) {
    std::vector<FrameRange> ranges;
    if (frames == 0) {
        return ranges;
    }
    workers = std::max<size_t>(workers, 1);

    const size_t frames_per_worker = (frames + workers - 1) / workers;
    for (size_t i = 0; i < workers; ++i) {
        const size_t begin = i * frames_per_worker;
        const size_t end = std::min(begin + frames_per_worker, frames);
        if (begin >= end) {
            break;
        }
        ranges.push_back(FrameRange{begin, end});
    }
    return ranges;
}

void ChunkScheduler::process_parallel_into(std::span<const float> stereo_chunk, size_t frames,
                                           std::span<float> output) {
    profiler_.start();

    const auto ranges = partition(frames, worker_banks_.size());

    auto work = [this, stereo_chunk, output](FrameRange range, FilterBank& bank) {
        bank.reset();
        process_frame_range(stereo_chunk, output, range.begin, range.end, mode_, bank_for(bank));
    };

    if (!ranges.empty()) {
        // jthread joins on destruction, including when a later spawn throws
        std::vector<std::jthread> workers;
        workers.reserve(ranges.size() - 1);
        for (size_t i = 1; i < ranges.size(); ++i) {
            workers.emplace_back(work, ranges[i], std::ref(worker_banks_[i]));
        }
        work(ranges[0], worker_banks_[0]);
    }

    profiler_.stop();
    report_timing(frames);
}

void ChunkScheduler::process_sequential_into(std::span<const float> stereo_chunk, size_t frames,
                                             std::span<float> output) {
    profiler_.start();
    process_frame_range(stereo_chunk, output, 0, frames, mode_, bank_for(sequential_bank_));
    profiler_.stop();
    report_timing(frames);
}

BufferPool::BufferPtr ChunkScheduler::process_chunk_parallel(std::span<const float> stereo_chunk, size_t frames) {
    auto block = pool_.borrow(frames * channels_);
    process_parallel_into(stereo_chunk, frames, block->view(frames * channels_));
    return block;
}

BufferPool::BufferPtr ChunkScheduler::process_chunk_sequential(std::span<const float> stereo_chunk, size_t frames) {
    auto block = pool_.borrow(frames * channels_);
    process_sequential_into(stereo_chunk, frames, block->view(frames * channels_));
    return block;
}

void ChunkScheduler::reset() {
    sequential_bank_.reset();
}

void ChunkScheduler::report_timing(size_t frames) {
#if SPATIALIZER_ENABLE_PROFILING
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(profiler_.elapsed()).count();
    auto& logger = AudioLogger::instance();
    logger.log_event("CHUNK_US", static_cast<float>(us));
    logger.log_event("CHUNK_FRAMES", static_cast<float>(frames));

    const auto audio_ns = std::chrono::nanoseconds(
        static_cast<int64_t>(frames) * 1'000'000'000 / sequential_bank_.sample_rate());
    if (profiler_.exceeds_budget(audio_ns)) {
        logger.log_message("ChunkScheduler", "Chunk processed slower than real time");
    }
#else
    (void)frames;
#endif
}

} // namespace spatializer
