// SPDX-License-Identifier: MIT

// include/xfer_pipe/object_key.hpp
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace xfer_pipe {

// Pure helpers over '/'-separated keys and paths. The extension is the
// suffix of the last path segment starting at its last '.', excluding a
// leading dot ("dir/.env" has no extension).

/// Last path segment: "a/b/c.csv" -> "c.csv".
std::string_view KeyBaseName(std::string_view key);

/// Everything before the last '/': "a/b/c.csv" -> "a/b"; "c.csv" -> "".
std::string_view KeyParent(std::string_view key);

/// Base name without extension: "a/b/c.csv" -> "c".
std::string_view KeyStem(std::string_view key);

/// Extension with the dot: "a/b/c.csv" -> ".csv"; "a/b/c" -> "".
std::string_view KeyExtension(std::string_view key);

/// Insert a part-index segment before the extension:
/// ("exports/data.csv", 3) -> "exports/data_3.csv".
std::string PartObjectKey(std::string_view key, uint32_t part_index);

/// Join a prefix and a name with exactly one '/'; empty prefix yields name.
std::string JoinKey(std::string_view prefix, std::string_view name);

}  // namespace xfer_pipe
