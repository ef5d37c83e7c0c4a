// SPDX-License-Identifier: MIT

// src/chunked_transfer_buffer.cpp
#include "xfer_pipe/chunked_transfer_buffer.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <fmt/format.h>

#include "xfer_pipe/checksum.hpp"
#include "xfer_pipe/error.hpp"
#include "xfer_pipe/logging.hpp"
#include "xfer_pipe/object_key.hpp"

namespace xfer_pipe {

namespace {

constexpr std::byte kLineTerminator{'\n'};

ChunkedBufferConfig Validated(ChunkedBufferConfig config, const IDestination& destination) {
    config.Validate(destination);
    return config;
}

std::string_view StateName(ChunkedTransferBuffer::State state) {
    switch (state) {
        case ChunkedTransferBuffer::State::Open: return "open";
        case ChunkedTransferBuffer::State::Closing: return "closing";
        case ChunkedTransferBuffer::State::Closed: return "closed";
        case ChunkedTransferBuffer::State::Aborted: return "aborted";
    }
    return "unknown";
}

// Index one past the last terminator in [0, limit), or nullopt.
std::optional<size_t> LastTerminatorWithin(const std::vector<std::byte>& buffer, size_t limit) {
    auto window_end = buffer.begin() + static_cast<std::ptrdiff_t>(std::min(limit, buffer.size()));
    auto rit = std::find(std::make_reverse_iterator(window_end), buffer.rend(), kLineTerminator);
    if (rit == buffer.rend()) return std::nullopt;
    return static_cast<size_t>(std::distance(buffer.begin(), rit.base()));
}

}  // namespace

void ChunkedBufferConfig::Validate(const IDestination& destination) const {
    if (key.empty()) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "Chunked transfer requires a destination key");
    }
    if (chunk_size == 0) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            fmt::format("Chunk size must be positive for '{}'", key));
    }
    if (num_workers == 0) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            fmt::format("Worker count must be positive for '{}'", key));
    }
    if (mode == TransferMode::SingleObjectMultipart && chunk_size < destination.MinPartSize()) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            fmt::format("Chunk size {} is below the destination minimum part size {} for '{}'",
                        chunk_size, destination.MinPartSize(), key));
    }
}

ChunkedTransferBuffer::ChunkedTransferBuffer(IDestination& destination,
                                             ChunkedBufferConfig config)
    : destination_(destination),
      config_(Validated(std::move(config), destination)),
      effective_key_(config_.compression
                         ? config_.key + std::string(config_.compression->Extension())
                         : config_.key),
      progress_(config_.total_size.value_or(0)),
      uploads_(fmt::format("upload:{}", config_.key),
               [this](UploadPool&, const UploadPool::Item& item) {
                   return UploadChunk(item.payload);
               },
               config_.num_workers) {}

ChunkedTransferBuffer::~ChunkedTransferBuffer() {
    if (state_ == State::Open && session_) {
        GetLogger()->warn("Multipart session {} for '{}' destroyed without Close() or Abort()",
                          *session_, effective_key_);
    }
}

void ChunkedTransferBuffer::Write(std::span<const std::byte> data) {
    if (state_ != State::Open) {
        throw SessionError(ErrorCode::InvalidState,
            fmt::format("Write on {} buffer for '{}'", StateName(state_), config_.key));
    }
    ThrowIfUploadFailed();
    if (data.empty()) return;

    buffer_.insert(buffer_.end(), data.begin(), data.end());
    bytes_written_ += data.size();
    ReportProgress(data.size());
    CarveReadyChunks();
}

std::vector<TransferResult> ChunkedTransferBuffer::Close() {
    if (state_ != State::Open) {
        throw SessionError(ErrorCode::InvalidState,
            fmt::format("Close on {} buffer for '{}'", StateName(state_), config_.key));
    }
    state_ = State::Closing;

    // Final chunk: always for a multipart session with no parts so that an
    // empty stream still commits one zero-byte object.
    if (!buffer_.empty() || next_part_ == 1) {
        DispatchChunk(std::exchange(buffer_, {}));
    }

    auto results = uploads_.Wait();

    if (config_.mode == TransferMode::SingleObjectMultipart) {
        std::vector<PartToken> parts;
        {
            std::lock_guard<std::mutex> lock(tokens_mutex_);
            parts = tokens_;
        }
        std::sort(parts.begin(), parts.end(),
                  [](const PartToken& a, const PartToken& b) {
                      return a.part_number < b.part_number;
                  });
        destination_.CompleteMultipart(*session_, parts);
        GetLogger()->info("Completed multipart upload of '{}' with {} part(s)",
                          effective_key_, parts.size());
    }

    state_ = State::Closed;
    return results;
}

void ChunkedTransferBuffer::Abort() {
    if (state_ == State::Closed || state_ == State::Aborted) return;
    state_ = State::Aborted;
    buffer_.clear();
    uploads_.Cancel();

    if (!session_) return;
    try {
        destination_.AbortMultipart(*session_);
        GetLogger()->info("Aborted multipart session {} for '{}'", *session_, effective_key_);
    } catch (const std::exception& e) {
        throw SessionError(ErrorCode::SessionAbortFailed,
            fmt::format("Failed to abort multipart session {} for '{}': {}",
                        *session_, effective_key_, e.what()));
    }
}

void ChunkedTransferBuffer::CarveReadyChunks() {
    while (buffer_.size() >= config_.chunk_size) {
        size_t boundary = config_.chunk_size;
        if (config_.mode == TransferMode::MultiObjectSplit) {
            auto split = FindSplitBoundary();
            if (!split) break;  // wait for a terminator
            boundary = *split;
        }
        auto cut = buffer_.begin() + static_cast<std::ptrdiff_t>(boundary);
        std::vector<std::byte> chunk(buffer_.begin(), cut);
        buffer_.erase(buffer_.begin(), cut);
        DispatchChunk(std::move(chunk));
    }
}

std::optional<size_t> ChunkedTransferBuffer::FindSplitBoundary() {
    if (auto boundary = LastTerminatorWithin(buffer_, config_.chunk_size)) {
        return boundary;
    }
    size_t limit = 2 * config_.chunk_size;
    if (buffer_.size() <= limit) return std::nullopt;

    // A record straddles the first window; allow one chunk up to the limit.
    if (auto boundary = LastTerminatorWithin(buffer_, limit)) {
        return boundary;
    }
    if (config_.oversize_policy == OversizeRecordPolicy::Fail) {
        throw TransferError(ErrorCode::RecordTooLarge,
            fmt::format("No line terminator within {} bytes while splitting '{}'",
                        limit, config_.key));
    }
    GetLogger()->warn("No line terminator within {} bytes while splitting '{}'; "
                      "cutting part {} mid-record", limit, config_.key, next_part_);
    return config_.chunk_size;
}

void ChunkedTransferBuffer::DispatchChunk(std::vector<std::byte> data) {
    uint32_t part = next_part_;

    ChunkJob job;
    job.part_index = part;
    if (config_.mode == TransferMode::SingleObjectMultipart) {
        if (part > destination_.MaxPartCount()) {
            throw ConfigurationError(ErrorCode::InvalidConfiguration,
                fmt::format("Part {} exceeds the destination limit of {} parts for '{}'",
                            part, destination_.MaxPartCount(), effective_key_));
        }
        EnsureSession();
        job.key = effective_key_;
        job.data = std::move(data);
    } else {
        job.key = PartObjectKey(config_.key, part);
        if (config_.compression) job.key += config_.compression->Extension();

        if (!header_captured_) {
            header_captured_ = true;
            auto first = std::find(data.begin(), data.end(), kLineTerminator);
            if (first != data.end()) {
                header_.assign(reinterpret_cast<const char*>(data.data()),
                               static_cast<size_t>(std::distance(data.begin(), first)) + 1);
            }
            job.data = std::move(data);
        } else {
            job.data.reserve(header_.size() + data.size());
            auto header_bytes = std::as_bytes(std::span<const char>(header_.data(), header_.size()));
            job.data.insert(job.data.end(), header_bytes.begin(), header_bytes.end());
            job.data.insert(job.data.end(), data.begin(), data.end());
        }
    }

    if (!uploads_.Put(fmt::format("part[{}]", part), std::move(job))) {
        ThrowIfUploadFailed();
        throw SessionError(ErrorCode::InvalidState,
            fmt::format("Upload pool for '{}' is shut down", config_.key));
    }
    ++next_part_;
}

void ChunkedTransferBuffer::EnsureSession() {
    if (session_) return;
    session_ = destination_.BeginMultipart(effective_key_);
    GetLogger()->debug("Opened multipart session {} for '{}'", *session_, effective_key_);
}

void ChunkedTransferBuffer::ThrowIfUploadFailed() const {
    if (auto error = uploads_.FirstError()) std::rethrow_exception(error);
}

void ChunkedTransferBuffer::ReportProgress(uint64_t bytes) {
    for (uint32_t percent : progress_.Advance(bytes)) {
        GetLogger()->info("Progress for '{}': {}% ({} of {})", config_.key, percent,
                          FormatSize(std::min(progress_.processed_bytes(), progress_.total_bytes())),
                          FormatSize(progress_.total_bytes()));
    }
}

std::vector<TransferResult> ChunkedTransferBuffer::UploadChunk(const ChunkJob& job) {
    TransferResult result;
    result.key = job.key;
    result.part_index = job.part_index;
    result.raw_size = job.data.size();

    std::vector<std::byte> compressed;
    std::span<const std::byte> body(job.data);
    if (config_.compression) {
        ZstdCompressor compressor(config_.compression->level);
        compressed = compressor.Compress(job.data);
        body = compressed;
        result.compressed = true;
    }

    result.size = body.size();
    result.sha256 = Sha256Hex(body);
    UploadWithRetry(job, body);

    GetLogger()->debug("Uploaded part {} of '{}' ({})", job.part_index, job.key,
                       FormatSize(result.size));
    return {std::move(result)};
}

void ChunkedTransferBuffer::UploadWithRetry(const ChunkJob& job, std::span<const std::byte> body) {
    RetryPolicy policy(config_.retry);
    auto on_retry = [&](const Exception& e, std::chrono::milliseconds delay, uint32_t retry) {
        GetLogger()->warn("Retrying part {} of '{}' in {}ms (retry {}): {}",
                          job.part_index, job.key, delay.count(), retry, e.what());
    };

    // Abort() cancels the pool first; a cancelled upload stops retrying.
    auto aborted = [this] { return uploads_.IsCancelled(); };

    if (config_.mode == TransferMode::MultiObjectSplit) {
        policy.Run([&] { destination_.PutObject(job.key, body); }, on_retry, aborted);
        return;
    }
    PartToken token = policy.Run(
        [&] { return destination_.UploadPart(*session_, job.part_index, body); },
        on_retry, aborted);
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    tokens_.push_back(std::move(token));
}

}  // namespace xfer_pipe
