/**
 * @file event_queue.hpp
 * @brief Closable FIFO channel between threads.
 *
 * Carries transport events into the connection state machine and status
 * notifications out of it. Producers never block; consumers either wait
 * for one item or drain everything pending.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/core/export.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace soodlink {
namespace core {

/**
 * @brief Counters for an event queue.
 */
struct QueueStats {
    size_t current_depth = 0;
    uint64_t total_enqueued = 0;
    uint64_t total_delivered = 0;
    uint64_t rejected_closed = 0;
    size_t high_watermark = 0;
};

/**
 * @brief Unbounded, thread-safe FIFO with close semantics.
 *
 * After close() new items are rejected, but items already queued can
 * still be taken, so a consumer can finish delivering before it exits.
 *
 * @tparam T Item type (must be movable).
 */
template<typename T>
class EventQueue {
public:
    EventQueue() = default;

    ~EventQueue() {
        close();
    }

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /**
     * @brief Append an item.
     * @return False if the queue is closed.
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_.load()) {
                stats_.rejected_closed++;
                return false;
            }
            items_.push_back(std::move(item));
            stats_.total_enqueued++;
            if (items_.size() > stats_.high_watermark) {
                stats_.high_watermark = items_.size();
            }
        }
        cv_.notify_all();
        return true;
    }

    /**
     * @brief Take the oldest item without waiting.
     */
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    /**
     * @brief Take the oldest item, waiting up to timeout for one.
     * @return nullopt on timeout, or when closed and empty.
     */
    template<typename Rep, typename Period>
    std::optional<T> waitPop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() {
            return closed_.load() || !items_.empty();
        });
        return popLocked();
    }

    /**
     * @brief Take every pending item, oldest first.
     */
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> result;
        result.reserve(items_.size());
        while (!items_.empty()) {
            result.push_back(std::move(items_.front()));
            items_.pop_front();
            stats_.total_delivered++;
        }
        return result;
    }

    /**
     * @brief Block until an item is pending, wake() is called, the queue
     * is closed, or the deadline passes. Does not consume anything.
     * @return True if items are pending.
     */
    bool waitUntilReady(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this]() {
            return closed_.load() || woken_ || !items_.empty();
        });
        woken_ = false;
        return !items_.empty();
    }

    /**
     * @brief Release a waitUntilReady() caller so it can re-read its deadline.
     */
    void wake() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            woken_ = true;
        }
        cv_.notify_all();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_.store(true);
        }
        cv_.notify_all();
    }

    bool isClosed() const {
        return closed_.load();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    QueueStats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        QueueStats result = stats_;
        result.current_depth = items_.size();
        return result;
    }

private:
    std::optional<T> popLocked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        stats_.total_delivered++;
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::atomic<bool> closed_{false};
    bool woken_ = false;
    QueueStats stats_;
};

}  // namespace core
}  // namespace soodlink
