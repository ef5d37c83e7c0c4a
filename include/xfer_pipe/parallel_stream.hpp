// SPDX-License-Identifier: MIT

// include/xfer_pipe/parallel_stream.hpp
#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "xfer_pipe/error.hpp"
#include "xfer_pipe/logging.hpp"
#include "xfer_pipe/work_queue.hpp"

namespace xfer_pipe {

struct ParallelStreamOptions {
    size_t num_consumers = 1;   ///< Consumer thread count
    size_t queue_size = 10;     ///< Queue capacity; producer blocks when full (0 = unbounded)
};

/// Bounded-queue producer/consumer pipeline.
///
/// The producer runs on its own thread and pushes into a bounded queue;
/// Push() blocks while the queue is full and returns false once the stream
/// has been shut down, at which point the producer should return. Consumers
/// pop until the queue is closed and empty.
///
/// A consumer failure closes and clears the queue so a blocked producer
/// wakes up and the remaining consumers stop after their current item.
/// Every error is collected; afterwards a TransferError(StreamFailed)
/// reports the count and the first message.
template <typename T>
void RunParallelStream(std::function<void(WorkQueue<T>&)> producer,
                       std::function<void(T&)> consumer,
                       ParallelStreamOptions options = {}) {
    if (options.num_consumers == 0) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "parallel stream requires at least one consumer");
    }

    WorkQueue<T> queue(options.queue_size);
    std::mutex errors_mutex;
    std::vector<std::string> errors;

    auto record = [&](const char* role, std::string message) {
        GetLogger()->error("{} failed: {}", role, message);
        std::lock_guard<std::mutex> lock(errors_mutex);
        errors.push_back(std::move(message));
    };

    std::thread producer_thread([&] {
        try {
            producer(queue);
        } catch (const std::exception& e) {
            record("Producer", e.what());
        }
        // Signal consumers that production is finished
        queue.Close();
    });

    std::vector<std::thread> consumers;
    consumers.reserve(options.num_consumers);
    for (size_t i = 0; i < options.num_consumers; ++i) {
        consumers.emplace_back([&] {
            for (;;) {
                auto item = queue.Pop();
                if (!item) break;
                try {
                    consumer(*item);
                    queue.TaskDone();
                } catch (const std::exception& e) {
                    queue.TaskDone();
                    record("Consumer", e.what());
                    // Unblock the producer if it is waiting on a full queue
                    queue.Close();
                    queue.Clear();
                    break;
                }
            }
        });
    }

    producer_thread.join();
    for (auto& t : consumers) t.join();

    if (!errors.empty()) {
        throw TransferError(ErrorCode::StreamFailed,
            fmt::format("Parallel stream failed with {} errors. First error: {}",
                        errors.size(), errors.front()));
    }
}

}  // namespace xfer_pipe
