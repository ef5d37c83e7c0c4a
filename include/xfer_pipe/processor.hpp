// SPDX-License-Identifier: MIT

// include/xfer_pipe/processor.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "xfer_pipe/error.hpp"
#include "xfer_pipe/logging.hpp"
#include "xfer_pipe/work_queue.hpp"

namespace xfer_pipe {

/// Unit of work handed from a producer to a worker. Immutable once enqueued.
template <typename Payload>
struct WorkItem {
    std::string name;     ///< Label used in logs, e.g. "fetch[3]" or a file name
    Payload payload;      ///< Opaque data for the worker
    size_t ordinal = 0;   ///< 0-based enqueue order within the Processor
};

// Processor<Payload, Result> - bounded worker pool over one unbounded queue.
//
// Put() enqueues work and starts the workers on first use. Each worker
// dequeues with a timeout, runs the action, appends its results under a
// lock, and marks the item done. Wait() joins the queue, then places one
// sentinel per worker and joins the threads.
//
// Self-feeding: the action may call Put() on the same Processor. The
// continuation is enqueued before the current item is marked done, so the
// queue can never look drained while a continuation is pending, and the
// shutdown sentinels are never placed ahead of it.
//
// Failure: the first exception thrown by the action is captured and stops
// that worker. From then on Put() drops new items and every worker discards
// queued items without running them. Wait() rethrows the captured exception
// exactly once.
//
// Cancel() discards queued items and closes the queue without waiting for
// in-flight actions. The destructor cancels and joins any running workers.
template <typename Payload, typename Result>
class Processor {
public:
    using Item = WorkItem<Payload>;
    using Action = std::function<std::vector<Result>(Processor&, const Item&)>;
    using CompletionCallback = std::function<void(Processor&)>;

    /// Dequeue timeout. Bounds how long an idle worker takes to notice
    /// failure or cancellation.
    static constexpr std::chrono::milliseconds kDequeueTimeout{100};

    /// @param name         Label for logs and thread diagnostics
    /// @param action       Invoked once per item on a worker thread
    /// @param num_workers  Worker thread count (1 for non-thread-safe sources)
    /// @param on_complete  Optional hook run by Wait() after workers exit
    /// @throws ConfigurationError if num_workers is 0
    Processor(std::string name, Action action, size_t num_workers = 1,
              CompletionCallback on_complete = {})
        : name_(std::move(name)),
          action_(std::move(action)),
          num_workers_(num_workers),
          on_complete_(std::move(on_complete)) {
        if (num_workers_ == 0) {
            throw ConfigurationError(ErrorCode::InvalidConfiguration,
                "Processor '" + name_ + "' requires at least one worker");
        }
    }

    ~Processor() {
        Cancel();
        JoinThreads();
    }

    // Non-copyable, non-movable (worker threads capture this)
    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    /// Enqueue one item. Safe to call from the producer and from workers.
    /// @return false if the item was dropped (after failure, cancel, or Wait).
    bool Put(std::string name, Payload payload) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stopping_) {
            GetLogger()->debug("{}: dropping '{}' after shutdown", name_, name);
            return false;
        }
        StartWorkersLocked();
        Item item{std::move(name), std::move(payload), item_count_};
        if (!queue_.Push(std::optional<Item>{std::move(item)})) return false;
        ++item_count_;
        return true;
    }

    /// Block until all submitted items drain and all workers exit.
    /// @return flattened results in completion order
    /// @throws the first exception raised by any worker action
    std::vector<Result> Wait() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (waited_) {
                throw SessionError(ErrorCode::InvalidState,
                    "Processor '" + name_ + "' already waited");
            }
            waited_ = true;
        }

        if (!threads_.empty()) {
            queue_.Join();
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                stopping_ = true;
            }
            for (size_t i = 0; i < threads_.size(); ++i) {
                queue_.Push(std::nullopt);
            }
            JoinThreads();
        }

        if (on_complete_) on_complete_(*this);

        std::exception_ptr error;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            error = error_;
        }
        if (error) std::rethrow_exception(error);

        std::lock_guard<std::mutex> lock(results_mutex_);
        return std::move(results_);
    }

    /// Stop accepting work, discard queued items, and let workers exit
    /// once their current action returns. Does not block.
    void Cancel() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (cancelled_) return;
            cancelled_ = true;
            stopping_ = true;
        }
        size_t dropped = queue_.Clear();
        queue_.Close();
        if (dropped > 0) {
            GetLogger()->debug("{}: cancelled with {} queued item(s)", name_, dropped);
        }
    }

    /// Number of items accepted by Put().
    size_t ItemCount() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return item_count_;
    }

    /// True once any worker action has thrown.
    bool HasFailed() const { return failed_.load(std::memory_order_acquire); }

    /// The captured worker exception, or null. Lets callers fail fast
    /// before Wait().
    std::exception_ptr FirstError() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return error_;
    }

    bool IsCancelled() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return cancelled_;
    }

    const std::string& Name() const { return name_; }
    size_t NumWorkers() const { return num_workers_; }

private:
    void StartWorkersLocked() {
        if (!threads_.empty()) return;
        GetLogger()->info("Starting {} parallel worker(s) for {}", num_workers_, name_);
        threads_.reserve(num_workers_);
        for (size_t i = 0; i < num_workers_; ++i) {
            threads_.emplace_back([this] { WorkerLoop(); });
        }
    }

    bool IsStopping() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return stopping_;
    }

    void WorkerLoop() {
        for (;;) {
            auto entry = queue_.PopFor(kDequeueTimeout);
            if (!entry) {
                // Timeout, or closed and empty
                if (queue_.IsClosed() || (HasFailed() && IsStopping())) break;
                continue;
            }
            if (!entry->has_value()) {
                queue_.TaskDone();  // shutdown sentinel
                break;
            }

            const Item& item = **entry;
            if (HasFailed() || IsCancelled()) {
                // Drain without executing
                queue_.TaskDone();
                continue;
            }

            if (!RunAction(item)) {
                queue_.TaskDone();
                size_t dropped = queue_.Clear();
                if (dropped > 0) {
                    GetLogger()->debug("{}: discarded {} queued item(s) after failure",
                                       name_, dropped);
                }
                break;
            }
            queue_.TaskDone();
        }
    }

    // Returns false if the action threw; the exception is recorded.
    bool RunAction(const Item& item) {
        try {
            auto out = action_(*this, item);
            if (!out.empty()) {
                std::lock_guard<std::mutex> lock(results_mutex_);
                for (auto& r : out) results_.push_back(std::move(r));
            }
            return true;
        } catch (const std::exception& e) {
            GetLogger()->error("{}: worker failed on '{}': {}", name_, item.name, e.what());
            RecordFailure(std::current_exception());
        } catch (...) {
            GetLogger()->error("{}: worker failed on '{}'", name_, item.name);
            RecordFailure(std::current_exception());
        }
        return false;
    }

    void RecordFailure(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!error_) error_ = std::move(error);
        stopping_ = true;
        failed_.store(true, std::memory_order_release);
    }

    void JoinThreads() {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

    std::string name_;
    Action action_;
    size_t num_workers_;
    CompletionCallback on_complete_;

    WorkQueue<std::optional<Item>> queue_;
    std::vector<std::thread> threads_;

    mutable std::mutex state_mutex_;
    size_t item_count_ = 0;
    bool stopping_ = false;
    bool cancelled_ = false;
    bool waited_ = false;
    std::exception_ptr error_;
    std::atomic<bool> failed_{false};

    std::mutex results_mutex_;
    std::vector<Result> results_;
};

}  // namespace xfer_pipe
