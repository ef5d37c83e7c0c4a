// SPDX-License-Identifier: MIT

// include/xfer_pipe/work_queue.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace xfer_pipe {

/// Blocking FIFO shared between producers and worker threads.
///
/// Capacity 0 means unbounded: Push() never blocks. With a capacity,
/// Push() blocks while the queue is full, which is how ParallelStream
/// applies backpressure to its producer.
///
/// Task accounting mirrors a join-able queue: every pushed item counts as
/// unfinished until a consumer calls TaskDone() for it. Join() blocks until
/// the unfinished count reaches zero.
///
/// Close() wakes every blocked caller. After Close(), Push() returns false
/// and pops return the remaining items, then nullopt.
template <typename T>
class WorkQueue {
public:
    explicit WorkQueue(size_t capacity = 0) : capacity_(capacity) {}

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /// Enqueue an item, blocking while the queue is at capacity.
    /// @return false if the queue was closed; the item is dropped.
    bool Push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || !Full(); });
        if (closed_) return false;
        items_.push_back(std::move(item));
        ++unfinished_;
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Dequeue an item, waiting at most @p timeout.
    /// @return nullopt on timeout, or when closed and empty.
    std::optional<T> PopFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout,
                                 [this] { return closed_ || !items_.empty(); })) {
            return std::nullopt;
        }
        return PopLocked(lock);
    }

    /// Dequeue an item, waiting until one arrives or the queue closes.
    std::optional<T> Pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return PopLocked(lock);
    }

    /// Dequeue without waiting.
    std::optional<T> TryPop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return PopLocked(lock);
    }

    /// Mark one previously dequeued item as finished.
    void TaskDone() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unfinished_ > 0 && --unfinished_ == 0) {
            all_done_.notify_all();
        }
    }

    /// Block until every pushed item has been marked done.
    void Join() {
        std::unique_lock<std::mutex> lock(mutex_);
        all_done_.wait(lock, [this] { return unfinished_ == 0; });
    }

    /// Reject further pushes and wake all waiters.
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /// Discard queued items, counting each as done.
    /// @return number of items discarded.
    size_t Clear() {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped = items_.size();
            items_.clear();
            unfinished_ -= std::min(unfinished_, dropped);
            if (unfinished_ == 0) all_done_.notify_all();
        }
        not_full_.notify_all();
        return dropped;
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t Unfinished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return unfinished_;
    }

    size_t Capacity() const noexcept { return capacity_; }

private:
    bool Full() const { return capacity_ > 0 && items_.size() >= capacity_; }

    std::optional<T> PopLocked(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::condition_variable all_done_;
    std::deque<T> items_;
    size_t unfinished_ = 0;
    bool closed_ = false;
};

}  // namespace xfer_pipe
