/**
 * @file test_event_queue.cpp
 * @brief Unit tests for EventQueue
 *
 * Tests cover:
 * - FIFO order for pop and drain
 * - Close semantics
 * - Readiness waits with deadline and wake()
 * - Statistics
 * - Thread safety
 */

#include <gtest/gtest.h>
#include <soodlink/core/event_queue.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace soodlink::core;
using namespace std::chrono_literals;

class EventQueueTest : public ::testing::Test {
protected:
    EventQueue<std::string> queue_;
};

// =============================================================================
// Basic Operations
// =============================================================================

TEST_F(EventQueueTest, DefaultConstruction) {
    EXPECT_TRUE(queue_.empty());
    EXPECT_EQ(queue_.size(), 0u);
    EXPECT_FALSE(queue_.isClosed());
    EXPECT_FALSE(queue_.tryPop().has_value());
}

TEST_F(EventQueueTest, PopsInFifoOrder) {
    EXPECT_TRUE(queue_.push("a"));
    EXPECT_TRUE(queue_.push("b"));
    EXPECT_TRUE(queue_.push("c"));
    EXPECT_EQ(queue_.size(), 3u);

    EXPECT_EQ(*queue_.tryPop(), "a");
    EXPECT_EQ(*queue_.waitPop(10ms), "b");
    EXPECT_EQ(*queue_.tryPop(), "c");
    EXPECT_TRUE(queue_.empty());
}

TEST_F(EventQueueTest, DrainTakesEverything) {
    queue_.push("first");
    queue_.push("second");

    std::vector<std::string> items = queue_.drain();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "first");
    EXPECT_EQ(items[1], "second");
    EXPECT_TRUE(queue_.empty());
    EXPECT_TRUE(queue_.drain().empty());
}

TEST_F(EventQueueTest, WaitPopTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto item = queue_.waitPop(50ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(item.has_value());
    EXPECT_GE(elapsed, 45ms);
}

// =============================================================================
// Close
// =============================================================================

TEST_F(EventQueueTest, CloseRejectsNewItemsButKeepsQueuedOnes) {
    queue_.push("queued");
    queue_.close();

    EXPECT_TRUE(queue_.isClosed());
    EXPECT_FALSE(queue_.push("late"));
    EXPECT_EQ(*queue_.waitPop(10ms), "queued");
    EXPECT_FALSE(queue_.waitPop(10ms).has_value());
}

TEST_F(EventQueueTest, CloseReleasesBlockedConsumer) {
    std::atomic<bool> returned{false};
    std::thread consumer([this, &returned]() {
        auto item = queue_.waitPop(10s);
        EXPECT_FALSE(item.has_value());
        returned.store(true);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(returned.load());
    queue_.close();
    consumer.join();
    EXPECT_TRUE(returned.load());
}

// =============================================================================
// Readiness
// =============================================================================

TEST_F(EventQueueTest, WaitUntilReadyReportsPendingItems) {
    queue_.push("x");
    EXPECT_TRUE(queue_.waitUntilReady(std::chrono::steady_clock::now() + 1s));

    // Nothing was consumed
    EXPECT_EQ(queue_.size(), 1u);
}

TEST_F(EventQueueTest, WaitUntilReadyHonoursDeadline) {
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue_.waitUntilReady(start + 60ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 55ms);
}

TEST_F(EventQueueTest, WakeReleasesWaiter) {
    std::thread waker([this]() {
        std::this_thread::sleep_for(30ms);
        queue_.wake();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue_.waitUntilReady(start + 10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    waker.join();
}

TEST_F(EventQueueTest, WakeBeforeWaitIsNotLost) {
    queue_.wake();

    auto start = std::chrono::steady_clock::now();
    queue_.waitUntilReady(start + 10s);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    // The wake was consumed; the next wait runs to its deadline
    start = std::chrono::steady_clock::now();
    queue_.waitUntilReady(start + 40ms);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 35ms);
}

// =============================================================================
// Statistics
// =============================================================================

TEST_F(EventQueueTest, Statistics) {
    queue_.push("a");
    queue_.push("b");
    queue_.push("c");
    queue_.tryPop();
    queue_.close();
    queue_.push("rejected");

    QueueStats stats = queue_.getStats();
    EXPECT_EQ(stats.total_enqueued, 3u);
    EXPECT_EQ(stats.total_delivered, 1u);
    EXPECT_EQ(stats.rejected_closed, 1u);
    EXPECT_EQ(stats.high_watermark, 3u);
    EXPECT_EQ(stats.current_depth, 2u);
}

// =============================================================================
// Thread Safety
// =============================================================================

TEST_F(EventQueueTest, ConcurrentProducersSingleConsumer) {
    const int num_producers = 4;
    const int items_per_producer = 500;

    EventQueue<int> queue;
    std::vector<std::thread> producers;
    for (int p = 0; p < num_producers; ++p) {
        producers.emplace_back([&queue, p, items_per_producer]() {
            for (int i = 0; i < items_per_producer; ++i) {
                queue.push(p * items_per_producer + i);
            }
        });
    }

    std::vector<int> lastSeen(num_producers, -1);
    int received = 0;
    while (received < num_producers * items_per_producer) {
        auto item = queue.waitPop(1s);
        ASSERT_TRUE(item.has_value());
        int producer = *item / items_per_producer;

        // Per-producer order is preserved
        EXPECT_GT(*item, lastSeen[producer]);
        lastSeen[producer] = *item;
        ++received;
    }

    for (auto& t : producers) {
        t.join();
    }
    EXPECT_TRUE(queue.empty());
}
