// SPDX-License-Identifier: MIT

// include/xfer_pipe/chunked_transfer_buffer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "xfer_pipe/byte_sink.hpp"
#include "xfer_pipe/compression.hpp"
#include "xfer_pipe/destination.hpp"
#include "xfer_pipe/processor.hpp"
#include "xfer_pipe/progress_tracker.hpp"
#include "xfer_pipe/retry_policy.hpp"
#include "xfer_pipe/transfer_stats.hpp"

namespace xfer_pipe {

enum class TransferMode {
    SingleObjectMultipart,   ///< One object assembled from N parts of one session
    MultiObjectSplit,        ///< N standalone objects split on line boundaries
};

/// What MultiObjectSplit does when no line terminator appears within
/// twice the chunk size.
enum class OversizeRecordPolicy {
    Fail,         ///< Raise TransferError(RecordTooLarge)
    ForceSplit,   ///< Log a warning and cut at chunk_size mid-record
};

struct ChunkedBufferConfig {
    std::string key;                                   ///< Destination key (split keys derive from it)
    TransferMode mode = TransferMode::SingleObjectMultipart;
    uint64_t chunk_size = 8 * 1024 * 1024;             ///< Bytes per part or object
    std::optional<CompressionSpec> compression;        ///< Per-chunk zstd when set
    std::optional<uint64_t> total_size;                ///< Expected bytes; enables progress logging
    size_t num_workers = 4;                            ///< Parallel uploads
    OversizeRecordPolicy oversize_policy = OversizeRecordPolicy::Fail;
    RetryConfig retry = RetryConfig::UploadDefaults(); ///< Per-part retry

    /// @throws ConfigurationError(InvalidConfiguration)
    void Validate(const IDestination& destination) const;
};

// ChunkedTransferBuffer - write sink fanning one sequential byte stream out
// to many parallel destination uploads.
//
// Write() appends to an accumulation buffer and carves chunk_size pieces
// off the front as they fill up. Each carved chunk gets the next part index
// and is dispatched to an internal upload Processor; the writer never waits
// for an upload. Close() flushes the remainder, waits for every upload and,
// in multipart mode, completes the session with tokens sorted by part.
//
// Write() and Close() must be called from one thread. Upload workers touch
// only the token list, which is guarded by its own mutex.
//
// The buffer does not abort its session on failure. The owner calls
// Abort() from its error handler.
class ChunkedTransferBuffer : public IByteSink {
public:
    enum class State {
        Open,
        Closing,   ///< Close() started; Abort() is still allowed if it failed
        Closed,
        Aborted,
    };

    /// @throws ConfigurationError if the config is invalid for `destination`
    ChunkedTransferBuffer(IDestination& destination, ChunkedBufferConfig config);
    ~ChunkedTransferBuffer() override;

    ChunkedTransferBuffer(const ChunkedTransferBuffer&) = delete;
    ChunkedTransferBuffer& operator=(const ChunkedTransferBuffer&) = delete;

    using IByteSink::Write;

    /// Append bytes, dispatching every chunk that fills up.
    /// @throws SessionError(InvalidState) if not open
    /// @throws TransferError(RecordTooLarge) under OversizeRecordPolicy::Fail
    /// @throws the first upload failure, as soon as it is observed
    void Write(std::span<const std::byte> data) override;

    /// Flush, wait for all uploads and commit.
    /// @return one TransferResult per chunk, in completion order
    /// @throws SessionError(InvalidState) on a second call
    std::vector<TransferResult> Close();

    /// Abort the open session and cancel queued uploads without waiting
    /// for in-flight ones. No-op after a successful Close() or a prior Abort().
    /// @throws SessionError(SessionAbortFailed) if the destination refuses
    void Abort();

    State state() const { return state_; }
    const ChunkedBufferConfig& config() const { return config_; }

    /// Key of the single object in multipart mode, compression extension included.
    const std::string& effective_key() const { return effective_key_; }

    /// Header line captured from the first split chunk, terminator included.
    const std::string& header() const { return header_; }

    /// Chunks handed to the upload pool so far.
    uint32_t chunks_dispatched() const { return next_part_ - 1; }

    /// Bytes accepted by Write() so far.
    uint64_t bytes_written() const { return bytes_written_; }

private:
    struct ChunkJob {
        uint32_t part_index = 0;
        std::string key;
        std::vector<std::byte> data;
    };

    using UploadPool = Processor<ChunkJob, TransferResult>;

    void CarveReadyChunks();
    std::optional<size_t> FindSplitBoundary();
    void DispatchChunk(std::vector<std::byte> data);
    void EnsureSession();
    void ThrowIfUploadFailed() const;
    void ReportProgress(uint64_t bytes);

    std::vector<TransferResult> UploadChunk(const ChunkJob& job);
    void UploadWithRetry(const ChunkJob& job, std::span<const std::byte> body);

    IDestination& destination_;
    ChunkedBufferConfig config_;
    std::string effective_key_;

    State state_ = State::Open;
    std::vector<std::byte> buffer_;
    std::string header_;
    bool header_captured_ = false;
    uint32_t next_part_ = 1;
    uint64_t bytes_written_ = 0;
    std::optional<std::string> session_;
    ProgressTracker progress_;

    std::mutex tokens_mutex_;
    std::vector<PartToken> tokens_;

    // Declared last: workers reference the members above.
    UploadPool uploads_;
};

}  // namespace xfer_pipe
