/**
 * @file BufferPool.hpp
 * @brief Manages a pool of pre-allocated sample blocks to avoid heap allocation per chunk.
 */

#ifndef SPATIALIZER_BUFFER_POOL_HPP
#define SPATIALIZER_BUFFER_POOL_HPP

#include <vector>
#include <memory>
#include <mutex>
#include <span>
#include <functional>
#include <algorithm>
#include <cstddef>

namespace spatializer {

/**
 * @brief A flat block of interleaved samples (stereo input or multichannel output).
 */
struct SampleBlock {
    std::vector<float> samples;

    explicit SampleBlock(size_t capacity)
        : samples(capacity, 0.0f)
    {}

    size_t capacity() const { return samples.size(); }

    /**
     * @brief View of the first @p count samples.
     */
    std::span<float> view(size_t count) {
        return std::span<float>(samples.data(), std::min(count, samples.size()));
    }
};

/**
 * @brief Pool of sample blocks shared by the pipeline thread and the scheduler.
 *
 * borrow() hands out the first pooled block whose capacity is large enough, or
 * allocates a new one. The returned handle gives the block back on destruction,
 * so a block is returned exactly once and cannot be touched afterwards by its
 * previous owner. The pool must outlive every handle it has issued.
 */
class BufferPool {
public:
    static constexpr size_t kMaxPooledBlocks = 32;

    /**
     * @param block_capacity Capacity (in samples) of the pre-allocated blocks.
     * @param initial_blocks Number of blocks to pre-allocate.
     */
    explicit BufferPool(size_t block_capacity = 0, size_t initial_blocks = 0)
    {
        for (size_t i = 0; i < initial_blocks && i < kMaxPooledBlocks; ++i) {
            pool_.push_back(std::make_unique<SampleBlock>(block_capacity));
            ++allocated_;
        }
    }

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    using BufferPtr = std::unique_ptr<SampleBlock, std::function<void(SampleBlock*)>>;

    /**
     * @brief Borrow a block holding at least @p min_samples samples.
     */
    BufferPtr borrow(size_t min_samples) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::unique_ptr<SampleBlock> block;
        auto it = std::find_if(pool_.begin(), pool_.end(),
            [min_samples](const std::unique_ptr<SampleBlock>& b) {
                return b->capacity() >= min_samples;
            });

        if (it == pool_.end()) {
            block = std::make_unique<SampleBlock>(min_samples);
            ++allocated_;
        } else {
            block = std::move(*it);
            pool_.erase(it);
        }
        ++outstanding_;

        // Custom deleter returns the block to the pool
        auto deleter = [this](SampleBlock* b) {
            give_back(std::unique_ptr<SampleBlock>(b));
        };

        return BufferPtr(block.release(), deleter);
    }

    /**
     * @brief Drop every pooled block. Outstanding blocks are unaffected.
     */
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        pool_.clear();
    }

    size_t available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pool_.size();
    }

    size_t outstanding() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }

    size_t allocated() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return allocated_;
    }

private:
    void give_back(std::unique_ptr<SampleBlock> block) {
        std::lock_guard<std::mutex> lock(mutex_);
        --outstanding_;
        if (pool_.size() < kMaxPooledBlocks) {
            pool_.push_back(std::move(block));
        }
    }

    std::vector<std::unique_ptr<SampleBlock>> pool_;
    size_t outstanding_ = 0;
    size_t allocated_ = 0;
    mutable std::mutex mutex_;
};

} // namespace spatializer

#endif // SPATIALIZER_BUFFER_POOL_HPP
