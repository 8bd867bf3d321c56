// =============================================================================
// statlog - Bounded Blocking Queue
// =============================================================================
// FIFO queue connecting two pipeline stages.
//
// - push() blocks while the queue is full
// - pop() blocks while the queue is empty and still open
// - close() lets the consumer drain what is left, then pop() returns nullopt
// - cancel() wakes everybody and makes push()/pop() fail immediately
// =============================================================================

#ifndef STATLOG_PIPELINE_BOUNDED_QUEUE_H
#define STATLOG_PIPELINE_BOUNDED_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace statlog::pipeline {

template <typename T>
class BoundedQueue {
public:
    /// @brief Construct with capacity (at least 1).
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// @brief Push an item, waiting for free space.
    /// @return false if the queue was closed or cancelled; item is dropped.
    bool push(T item) {
        std::unique_lock lock(mutex_);
        notFull_.wait(lock, [this] { return items_.size() < capacity_ || closed_ || cancelled_; });
        if (closed_ || cancelled_) {
            return false;
        }
        items_.push_back(std::move(item));
        notEmpty_.notify_one();
        return true;
    }

    /// @brief Pop the oldest item, waiting for one to arrive.
    /// @return nullopt once the queue is closed and drained, or cancelled.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        notEmpty_.wait(lock, [this] { return !items_.empty() || closed_ || cancelled_; });
        if (cancelled_ || items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        notFull_.notify_one();
        return item;
    }

    /// @brief Mark end of input.
    void close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    /// @brief Abort both ends and discard pending items.
    void cancel() {
        std::lock_guard lock(mutex_);
        cancelled_ = true;
        items_.clear();
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    [[nodiscard]] bool isCancelled() const {
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notFull_;
    std::condition_variable notEmpty_;
    std::deque<T> items_;
    bool closed_ = false;
    bool cancelled_ = false;
};

}  // namespace statlog::pipeline

#endif  // STATLOG_PIPELINE_BOUNDED_QUEUE_H
