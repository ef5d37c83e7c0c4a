// SPDX-License-Identifier: MIT

// include/xfer_pipe/streaming_executor.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "xfer_pipe/logging.hpp"
#include "xfer_pipe/processor.hpp"
#include "xfer_pipe/transfer_stats.hpp"

namespace xfer_pipe {

/// Processor specialization used by transfer operators: workers return
/// the TransferResults of the item they moved.
template <typename Payload>
using StreamProcessor = Processor<Payload, TransferResult>;

/// Results and statistics of one ExecuteStreaming() run.
struct StreamingOutcome {
    TransferSummary summary;
    std::vector<TransferResult> results;
};

/// Run one producer and N workers to completion.
///
/// The producer runs synchronously on the calling thread and receives the
/// Processor so it can Put() items as it discovers them; workers start on
/// the first Put(), so scanning and processing overlap. After the producer
/// returns, Wait() drains the queue and the summary is derived from the
/// flattened worker results. A run that discovers nothing yields a
/// zero-valued summary.
///
/// @throws whatever the producer throws, or the first worker exception.
template <typename Payload>
StreamingOutcome ExecuteStreaming(
        std::function<void(StreamProcessor<Payload>&)> producer,
        typename StreamProcessor<Payload>::Action worker,
        size_t num_workers = 5,
        std::string name = "streaming") {
    auto start = std::chrono::steady_clock::now();

    StreamProcessor<Payload> processor(std::move(name), std::move(worker), num_workers);

    try {
        producer(processor);
    } catch (const std::exception& e) {
        GetLogger()->error("{}: producer failed: {}", processor.Name(), e.what());
        throw;  // ~Processor cancels and joins the workers
    }

    StreamingOutcome outcome;
    outcome.results = processor.Wait();
    // Counted after Wait() so self-fed continuations are included
    uint64_t source_items = processor.ItemCount();

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    outcome.summary = SummarizeResults(outcome.results, source_items, elapsed);
    return outcome;
}

}  // namespace xfer_pipe
