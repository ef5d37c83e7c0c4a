// SPDX-License-Identifier: MIT

// src/checksum.cpp
#include "xfer_pipe/checksum.hpp"

#include <openssl/evp.h>

#include <string_view>

#include "xfer_pipe/error.hpp"

namespace xfer_pipe {

std::string Sha256Hex(std::span<const std::byte> data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw TransferError(ErrorCode::PartUploadFailed, "SHA-256 digest failed");
    }

    static constexpr std::string_view kHex = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex.push_back(kHex[digest[i] >> 4]);
        hex.push_back(kHex[digest[i] & 0x0f]);
    }
    return hex;
}

}  // namespace xfer_pipe
