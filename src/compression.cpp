// SPDX-License-Identifier: MIT

// src/compression.cpp
#include "xfer_pipe/compression.hpp"

#include <zstd.h>

#include <memory>
#include <string>

#include "xfer_pipe/error.hpp"

namespace xfer_pipe {

namespace {

struct DStreamDeleter {
    void operator()(ZSTD_DStream* ds) const { ZSTD_freeDStream(ds); }
};

}  // namespace

ZstdCompressor::ZstdCompressor(int level) : level_(level) {
    cctx_ = ZSTD_createCCtx();
    if (!cctx_) {
        throw TransferError(ErrorCode::CompressionFailed, "Failed to create ZSTD_CCtx");
    }
}

ZstdCompressor::~ZstdCompressor() {
    if (cctx_) {
        ZSTD_freeCCtx(cctx_);
        cctx_ = nullptr;
    }
}

std::vector<std::byte> ZstdCompressor::Compress(std::span<const std::byte> input) {
    std::vector<std::byte> out(ZSTD_compressBound(input.size()));
    size_t written = ZSTD_compressCCtx(cctx_, out.data(), out.size(),
                                       input.data(), input.size(), level_);
    if (ZSTD_isError(written)) {
        throw TransferError(ErrorCode::CompressionFailed,
            std::string("ZSTD compression failed: ") + ZSTD_getErrorName(written));
    }
    out.resize(written);
    return out;
}

std::vector<std::byte> ZstdDecompress(std::span<const std::byte> input) {
    std::unique_ptr<ZSTD_DStream, DStreamDeleter> dstream(ZSTD_createDStream());
    if (!dstream) {
        throw TransferError(ErrorCode::CompressionFailed, "Failed to create ZSTD_DStream");
    }
    size_t init_result = ZSTD_initDStream(dstream.get());
    if (ZSTD_isError(init_result)) {
        throw TransferError(ErrorCode::CompressionFailed,
            std::string("Failed to initialize ZSTD_DStream: ") +
            ZSTD_getErrorName(init_result));
    }

    std::vector<std::byte> output;
    std::vector<std::byte> block(ZSTD_DStreamOutSize());
    ZSTD_inBuffer in_buf = {input.data(), input.size(), 0};
    size_t last_result = 0;

    while (in_buf.pos < in_buf.size) {
        ZSTD_outBuffer out_buf = {block.data(), block.size(), 0};
        size_t result = ZSTD_decompressStream(dstream.get(), &out_buf, &in_buf);
        if (ZSTD_isError(result)) {
            throw TransferError(ErrorCode::CompressionFailed,
                std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(result));
        }
        last_result = result;
        output.insert(output.end(), block.begin(), block.begin() + out_buf.pos);
    }

    // Flush output still held by the stream for the final frame
    while (last_result != 0) {
        ZSTD_outBuffer out_buf = {block.data(), block.size(), 0};
        size_t result = ZSTD_decompressStream(dstream.get(), &out_buf, &in_buf);
        if (ZSTD_isError(result)) {
            throw TransferError(ErrorCode::CompressionFailed,
                std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(result));
        }
        if (out_buf.pos == 0 && result != 0) {
            throw TransferError(ErrorCode::CompressionFailed, "Incomplete zstd frame");
        }
        last_result = result;
        output.insert(output.end(), block.begin(), block.begin() + out_buf.pos);
    }
    return output;
}

}  // namespace xfer_pipe
