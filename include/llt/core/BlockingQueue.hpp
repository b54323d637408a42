/**
 * BlockingQueue.hpp - Ordered hand-off queue between pipeline threads
 *
 * Multi-producer/multi-consumer FIFO with optional capacity.
 * - tryPush() never blocks (safe from an audio driver callback)
 * - pushFor()/popFor() wait at most the given timeout
 * - close() wakes all waiters; pops keep draining what is left
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace llt::core {

template<typename T>
class BlockingQueue {
public:
    /// capacity 0 = unbounded
    explicit BlockingQueue(size_t capacity = 0) : capacity_(capacity) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /**
     * Push without waiting.
     * @return false if the queue is full or closed (item is dropped)
     */
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            if (capacity_ > 0 && items_.size() >= capacity_) {
                dropped_++;
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * Push, waiting up to timeout for free space.
     * @return false on timeout or if the queue is closed
     */
    template<typename Rep, typename Period>
    bool pushFor(T item, std::chrono::duration<Rep, Period> timeout) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            bool ready = not_full_.wait_for(lock, timeout, [this]() {
                return closed_ || capacity_ == 0 || items_.size() < capacity_;
            });
            if (!ready || closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * Pop the oldest item, waiting up to timeout.
     * Returns nullopt on timeout, or when closed and empty.
     */
    template<typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::optional<T> item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait_for(lock, timeout, [this]() {
                return !items_.empty() || closed_;
            });
            if (items_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    std::optional<T> tryPop() {
        return popFor(std::chrono::milliseconds(0));
    }

    /// No more pushes accepted. Remaining items can still be popped.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /// Closed and fully drained.
    bool isFinished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && items_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }

    /// Items rejected by tryPush() because the queue was full.
    size_t droppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    size_t capacity_;
    size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace llt::core
