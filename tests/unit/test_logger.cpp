#include <gtest/gtest.h>
#include "Logger.hpp"
#include <atomic>
#include <thread>
#include <chrono>
#include <vector>
#include <string>

using namespace spatializer;

TEST(LoggerTest, SingleThreadedPushPop) {
    auto& logger = AudioLogger::instance();

    // Clear any existing entries
    while (logger.pop_entry()) {}

    logger.log_message("TEST", "Hello World");
    logger.log_event("CHUNK_US", 42.0f);

    auto entry1 = logger.pop_entry();
    ASSERT_TRUE(entry1.has_value());
    EXPECT_EQ(entry1->type, LogEntry::Type::Message);
    EXPECT_STREQ(entry1->tag, "TEST");
    EXPECT_STREQ(entry1->message, "Hello World");

    auto entry2 = logger.pop_entry();
    ASSERT_TRUE(entry2.has_value());
    EXPECT_EQ(entry2->type, LogEntry::Type::Event);
    EXPECT_STREQ(entry2->tag, "CHUNK_US");
    EXPECT_EQ(entry2->value, 42.0f);
    EXPECT_GE(entry2->timestamp, entry1->timestamp);

    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST(LoggerTest, LongTextIsTruncated) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    const std::string long_tag(100, 't');
    const std::string long_msg(200, 'm');
    logger.log_message(long_tag.c_str(), long_msg.c_str());

    auto entry = logger.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(std::string(entry->tag).size(), sizeof(entry->tag) - 1);
    EXPECT_EQ(std::string(entry->message).size(), sizeof(entry->message) - 1);
}

TEST(LoggerTest, RingDropsWhenFull) {
    LockFreeRingBuffer<int, 8> ring;
    int pushed = 0;
    for (int i = 0; i < 20; ++i) {
        if (ring.push(i)) ++pushed;
    }
    // One slot stays free to tell full from empty
    EXPECT_EQ(pushed, 7);
    EXPECT_EQ(ring.pop(), 0);
    EXPECT_TRUE(ring.push(100));
}

TEST(LoggerTest, ConcurrentProducersKeepEveryEntry) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    std::atomic<bool> running{true};
    std::vector<LogEntry> captured;

    // Consumer drains while the workers produce
    std::thread consumer([&]() {
        while (true) {
            if (auto entry = logger.pop_entry()) {
                captured.push_back(*entry);
            } else if (!running) {
                break;
            } else {
                std::this_thread::yield();
            }
        }
    });

    std::vector<std::thread> producers;
    for (int t = 0; t < 2; ++t) {
        producers.emplace_back([&logger, t]() {
            for (int i = 0; i < 100; ++i) {
                logger.log_event(t == 0 ? "W0" : "W1", static_cast<float>(i));
            }
        });
    }
    for (auto& p : producers) {
        p.join();
    }
    running = false;
    consumer.join();
    while (auto entry = logger.pop_entry()) {
        captured.push_back(*entry);
    }

    // Capacity exceeds 200, so nothing was dropped
    EXPECT_EQ(captured.size(), 200u);

    // Per producer order is preserved
    float last_w0 = -1.0f;
    float last_w1 = -1.0f;
    for (const auto& e : captured) {
        float& last = (std::string(e.tag) == "W0") ? last_w0 : last_w1;
        EXPECT_GT(e.value, last);
        last = e.value;
    }
    EXPECT_EQ(last_w0, 99.0f);
    EXPECT_EQ(last_w1, 99.0f);
}

TEST(LoggerTest, FlushDrainsEverything) {
    auto& logger = AudioLogger::instance();
    logger.log_event("PIPE_CANCEL", 1.0f);
    logger.log_message("TEST", "flushed");
    logger.flush();
    EXPECT_FALSE(logger.pop_entry().has_value());
}
