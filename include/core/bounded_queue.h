#pragma once

/**
 * @file bounded_queue.h
 * @brief Bounded multi-producer queue with drop-oldest overflow
 *
 * Used for every cross-thread channel:
 * - Frame queue (capture/upload -> vision consumer)
 * - State update requests (vision consumer -> bridge)
 * - Outbound events (vision/bridge -> event loop)
 */

#include "logger.h"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gate_sentry {

/**
 * @brief Fixed-capacity FIFO; pushing into a full queue evicts the oldest item
 *
 * Any number of producers, one consumer. Overflow is logged and counted,
 * never reported to the producer as an error.
 */
template<typename T>
class BoundedQueue {
public:
    BoundedQueue(size_t capacity, std::string name)
        : capacity_(capacity == 0 ? 1 : capacity), name_(std::move(name)) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Enqueue an item, evicting the oldest when full
     * @return true if an item was evicted to make room
     */
    bool push(T item) {
        bool evicted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
                evicted = true;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        if (evicted) {
            Logger::warn("[Queue] " + name_ + " full (capacity " + std::to_string(capacity_) +
                         "), dropped oldest item");
        }
        return evicted;
    }

    /**
     * @brief Put an item back at the head (retry path)
     * @return false if the queue is full; the item is dropped and counted
     */
    bool push_front(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.size() >= capacity_) {
                ++dropped_;
                return false;
            }
            items_.push_front(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Remove up to max_items from the head, oldest first
     */
    std::vector<T> drain(size_t max_items) {
        std::vector<T> out;
        std::lock_guard<std::mutex> lock(mutex_);
        while (!items_.empty() && out.size() < max_items) {
            out.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return out;
    }

    /**
     * @brief Empty the queue and return only the most recently pushed item
     * @param discarded Set to the number of older items thrown away
     */
    std::optional<T> drain_latest(size_t* discarded = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (discarded) *discarded = items_.empty() ? 0 : items_.size() - 1;
        if (items_.empty()) return std::nullopt;
        T latest = std::move(items_.back());
        items_.clear();
        return latest;
    }

    /**
     * @brief Block until the queue is non-empty or the timeout elapses
     * @return true if an item is available
     */
    bool wait_for_item(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this] { return !items_.empty() || woken_; }) && !items_.empty();
    }

    /// Release any consumer blocked in wait_for_item (shutdown)
    void wake_all() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            woken_ = true;
        }
        cv_.notify_all();
    }

    /// Re-arm wait_for_item after wake_all() (consumer restart)
    void reset_wake() {
        std::lock_guard<std::mutex> lock(mutex_);
        woken_ = false;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }

    /// Total items evicted by overflow since construction
    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

private:
    const size_t capacity_;
    const std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    size_t dropped_ = 0;
    bool woken_ = false;
};

} // namespace gate_sentry
