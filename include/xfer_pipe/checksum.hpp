// SPDX-License-Identifier: MIT

// include/xfer_pipe/checksum.hpp
#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace xfer_pipe {

/// Lowercase hex SHA-256 digest of @p data (64 characters).
std::string Sha256Hex(std::span<const std::byte> data);

}  // namespace xfer_pipe
