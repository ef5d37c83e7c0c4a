// SPDX-License-Identifier: MIT

// include/xfer_pipe/progress_tracker.hpp
#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

namespace xfer_pipe {

// ProgressTracker - reports each 10% threshold of a known total once.
//
// Not thread-safe; the ChunkedTransferBuffer only advances it from the
// writer thread. Progress past the total clamps at 100.
class ProgressTracker {
public:
    static constexpr uint32_t kStepPercent = 10;

    /// @param total_bytes expected total; 0 disables reporting
    explicit ProgressTracker(uint64_t total_bytes = 0) : total_bytes_(total_bytes) {}

    /// Record `bytes` more processed.
    /// @return thresholds crossed by this call, ascending (e.g. {10, 20})
    std::vector<uint32_t> Advance(uint64_t bytes) {
        std::vector<uint32_t> crossed;
        if (total_bytes_ == 0) return crossed;

        processed_bytes_ += bytes;
        uint64_t percent = std::min<uint64_t>(processed_bytes_ * 100 / total_bytes_, 100);
        uint32_t reached = static_cast<uint32_t>(percent / kStepPercent) * kStepPercent;
        while (last_reported_ < reached) {
            last_reported_ += kStepPercent;
            crossed.push_back(last_reported_);
        }
        return crossed;
    }

    bool enabled() const { return total_bytes_ > 0; }
    uint64_t total_bytes() const { return total_bytes_; }
    uint64_t processed_bytes() const { return processed_bytes_; }
    uint32_t last_reported() const { return last_reported_; }

private:
    uint64_t total_bytes_;
    uint64_t processed_bytes_ = 0;
    uint32_t last_reported_ = 0;
};

}  // namespace xfer_pipe
