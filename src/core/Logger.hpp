/**
 * @file Logger.hpp
 * @brief RT-safe telemetry logger shared by the DSP workers and the pipeline.
 */

#ifndef SPATIALIZER_LOGGER_HPP
#define SPATIALIZER_LOGGER_HPP

#include <atomic>
#include <array>
#include <optional>
#include <cstring>
#include <cstdint>
#include <chrono>
#include <iostream>

namespace spatializer {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type;
    char tag[32];      // Category or Tag
    float value;       // Numeric value (for Type::Event)
    char message[64];  // Static message (for Type::Message)
    uint64_t timestamp; // Microseconds since logger creation
};

/**
 * @brief A lock-free, single-producer single-consumer RingBuffer for RT-Safe logging.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    bool push(const T& item) {
        size_t h = head.load(std::memory_order_relaxed);
        size_t t = tail.load(std::memory_order_acquire);

        if (((h + 1) & mask) == t) {
            return false; // Full
        }

        buffer[h] = item;
        head.store((h + 1) & mask, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        size_t t = tail.load(std::memory_order_relaxed);
        size_t h = head.load(std::memory_order_acquire);

        if (t == h) {
            return std::nullopt; // Empty
        }

        T item = buffer[t];
        tail.store((t + 1) & mask, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head.load(std::memory_order_acquire) == tail.load(std::memory_order_acquire);
    }

private:
    std::array<T, Size> buffer;
    static constexpr size_t mask = Size - 1;
    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};
};

/**
 * @brief Singleton Logger for chunk-processing telemetry.
 *
 * Producers are the pipeline thread and the scheduler workers; all producer
 * calls are serialized through a spin flag so the ring stays single-producer
 * without ever blocking on a mutex. Entries that do not fit are dropped.
 */
class AudioLogger {
public:
    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    // Producer Methods (RT-Safe)
    void log_message(const char* tag, const char* msg) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp = now_us();
        push(entry);
    }

    void log_event(const char* tag, float value) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp = now_us();
        push(entry);
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        return ring_buffer.pop();
    }

    /**
     * @brief Drain all pending entries to std::clog.
     *
     * Not RT-safe. Call from the control thread only.
     */
    void flush() {
        while (auto entry = ring_buffer.pop()) {
            if (entry->type == LogEntry::Type::Message) {
                std::clog << "[" << entry->tag << "] " << entry->message << std::endl;
            } else {
                std::clog << "[" << entry->tag << "] " << entry->value << std::endl;
            }
        }
    }

private:
    AudioLogger() : origin_(std::chrono::steady_clock::now()) {}

    void push(const LogEntry& entry) {
        while (producer_busy_.test_and_set(std::memory_order_acquire)) {
            // Writers only hold the flag for one copy
        }
        ring_buffer.push(entry);
        producer_busy_.clear(std::memory_order_release);
    }

    uint64_t now_us() const {
        auto elapsed = std::chrono::steady_clock::now() - origin_;
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    }

    LockFreeRingBuffer<LogEntry, 1024> ring_buffer;
    std::atomic_flag producer_busy_ = ATOMIC_FLAG_INIT;
    std::chrono::steady_clock::time_point origin_;
};

} // namespace spatializer

#endif // SPATIALIZER_LOGGER_HPP
