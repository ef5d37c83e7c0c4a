// SPDX-License-Identifier: MIT

// include/xfer_pipe/transfer_stats.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>

namespace xfer_pipe {

/// Outcome of one uploaded chunk (one object, or one part of a session).
struct TransferResult {
    std::string key;           ///< Destination key the bytes landed under
    uint64_t size = 0;         ///< Bytes uploaded (after compression)
    uint32_t part_index = 0;   ///< 1-based part index, assigned at carve time
    uint64_t raw_size = 0;     ///< Bytes before compression
    bool compressed = false;   ///< True if the chunk was zstd-compressed
    std::string sha256;        ///< Hex SHA-256 of the uploaded bytes
    std::string source;        ///< Source path, filled in by file operators
};

/// Aggregate statistics for one streaming run.
struct TransferSummary {
    uint64_t source_items = 0;    ///< Items accepted by the Processor
    uint64_t total_files = 0;     ///< TransferResult entries produced
    uint64_t total_bytes = 0;     ///< Sum of TransferResult::size
    std::chrono::duration<double> duration{0};

    /// Bytes per second; 0 when nothing moved or no time elapsed.
    double ThroughputBytesPerSecond() const;

    /// e.g. "1.5 MB"
    std::string TotalSizeHuman() const;

    /// e.g. "12.3 MB/s"; "0 B/s" when nothing moved.
    std::string ThroughputHuman() const;
};

/// Format a byte count with binary units, trimming trailing zeros
/// ("0 B", "512 B", "1.5 KB", "2 GB").
std::string FormatSize(uint64_t size_bytes);

/// Format bytes/duration as "<size>/s"; "0 B/s" when either is zero.
std::string FormatThroughput(uint64_t total_bytes, double duration_seconds);

/// Build a summary from the flattened results of a run.
TransferSummary SummarizeResults(std::span<const TransferResult> results,
                                 uint64_t source_items,
                                 std::chrono::duration<double> duration);

}  // namespace xfer_pipe
