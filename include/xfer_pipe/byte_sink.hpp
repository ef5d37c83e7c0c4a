// SPDX-License-Identifier: MIT

// include/xfer_pipe/byte_sink.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <string_view>

namespace xfer_pipe {

/// Concept for anything a source can stream item bytes into.
template <typename S>
concept ByteWriter = requires(S& s, std::span<const std::byte> data) {
    { s.Write(data) } -> std::same_as<void>;
};

/// Runtime interface for a write sink. Source adapters stream one item's
/// bytes into an IByteSink without knowing what sits behind it.
class IByteSink {
public:
    virtual ~IByteSink() = default;

    /// Append bytes. May throw on downstream failure.
    virtual void Write(std::span<const std::byte> data) = 0;

    void Write(std::string_view text) {
        Write(std::as_bytes(std::span<const char>(text.data(), text.size())));
    }
};

static_assert(ByteWriter<IByteSink>, "IByteSink must satisfy ByteWriter");

}  // namespace xfer_pipe
