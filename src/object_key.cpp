// SPDX-License-Identifier: MIT

// src/object_key.cpp
#include "xfer_pipe/object_key.hpp"

#include <fmt/format.h>

namespace xfer_pipe {

std::string_view KeyBaseName(std::string_view key) {
    auto slash = key.rfind('/');
    return slash == std::string_view::npos ? key : key.substr(slash + 1);
}

std::string_view KeyParent(std::string_view key) {
    auto slash = key.rfind('/');
    return slash == std::string_view::npos ? std::string_view{} : key.substr(0, slash);
}

std::string_view KeyStem(std::string_view key) {
    auto base = KeyBaseName(key);
    auto dot = base.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return base;
    return base.substr(0, dot);
}

std::string_view KeyExtension(std::string_view key) {
    auto base = KeyBaseName(key);
    auto dot = base.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return {};
    return base.substr(dot);
}

std::string PartObjectKey(std::string_view key, uint32_t part_index) {
    auto ext = KeyExtension(key);
    auto head = key.substr(0, key.size() - ext.size());
    return fmt::format("{}_{}{}", head, part_index, ext);
}

std::string JoinKey(std::string_view prefix, std::string_view name) {
    while (!prefix.empty() && prefix.back() == '/') prefix.remove_suffix(1);
    while (!name.empty() && name.front() == '/') name.remove_prefix(1);
    if (prefix.empty()) return std::string(name);
    return fmt::format("{}/{}", prefix, name);
}

}  // namespace xfer_pipe
