// SPDX-License-Identifier: MIT

// src/transfer_stats.cpp
#include "xfer_pipe/transfer_stats.hpp"

#include <array>
#include <string_view>

#include <fmt/format.h>

namespace xfer_pipe {

std::string FormatSize(uint64_t size_bytes) {
    if (size_bytes == 0) return "0 B";

    constexpr std::array<std::string_view, 7> kUnits = {
        "B", "KB", "MB", "GB", "TB", "PB", "EB"};
    double value = static_cast<double>(size_bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < kUnits.size() - 1) {
        value /= 1024.0;
        ++unit;
    }

    std::string number = fmt::format("{:.2f}", value);
    // Trim "1.50" -> "1.5", "2.00" -> "2"
    while (!number.empty() && number.back() == '0') number.pop_back();
    if (!number.empty() && number.back() == '.') number.pop_back();
    return fmt::format("{} {}", number, kUnits[unit]);
}

std::string FormatThroughput(uint64_t total_bytes, double duration_seconds) {
    if (duration_seconds <= 0.0 || total_bytes == 0) return "0 B/s";
    double bps = static_cast<double>(total_bytes) / duration_seconds;
    return FormatSize(static_cast<uint64_t>(bps)) + "/s";
}

double TransferSummary::ThroughputBytesPerSecond() const {
    double seconds = duration.count();
    if (seconds <= 0.0 || total_bytes == 0) return 0.0;
    return static_cast<double>(total_bytes) / seconds;
}

std::string TransferSummary::TotalSizeHuman() const {
    return FormatSize(total_bytes);
}

std::string TransferSummary::ThroughputHuman() const {
    return FormatThroughput(total_bytes, duration.count());
}

TransferSummary SummarizeResults(std::span<const TransferResult> results,
                                 uint64_t source_items,
                                 std::chrono::duration<double> duration) {
    TransferSummary summary;
    summary.source_items = source_items;
    summary.total_files = results.size();
    for (const auto& r : results) {
        summary.total_bytes += r.size;
    }
    summary.duration = duration;
    return summary;
}

}  // namespace xfer_pipe
