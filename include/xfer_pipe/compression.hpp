// SPDX-License-Identifier: MIT

// include/xfer_pipe/compression.hpp
#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

struct ZSTD_CCtx_s;

namespace xfer_pipe {

enum class CompressionType {
    Zstd,
};

/// Per-chunk compression settings for a ChunkedTransferBuffer.
struct CompressionSpec {
    CompressionType type = CompressionType::Zstd;
    int level = 3;   ///< zstd level (1..22)

    /// File extension appended to destination keys, with the dot.
    std::string_view Extension() const { return ".zst"; }
};

// ZstdCompressor - one-shot zstd frame compression of a chunk.
//
// Owns a ZSTD_CCtx; not thread-safe, so each upload worker uses its own
// instance. Every Compress() call produces one complete, independently
// decodable frame.
class ZstdCompressor {
public:
    /// @throws TransferError(CompressionFailed) if the context cannot be created
    explicit ZstdCompressor(int level = 3);
    ~ZstdCompressor();

    ZstdCompressor(const ZstdCompressor&) = delete;
    ZstdCompressor& operator=(const ZstdCompressor&) = delete;

    /// @throws TransferError(CompressionFailed)
    std::vector<std::byte> Compress(std::span<const std::byte> input);

    int level() const { return level_; }

private:
    ZSTD_CCtx_s* cctx_ = nullptr;
    int level_;
};

/// Decompress one or more concatenated zstd frames (as produced by
/// compressing each multipart chunk independently).
/// @throws TransferError(CompressionFailed) on corrupt or truncated input
std::vector<std::byte> ZstdDecompress(std::span<const std::byte> input);

}  // namespace xfer_pipe
