// SPDX-License-Identifier: MIT

// include/xfer_pipe/memory_object_store.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "xfer_pipe/destination.hpp"

namespace xfer_pipe {

// MemoryObjectStore - in-memory IDestination.
//
// Thread-safe. Multipart sessions keep their parts until completion, which
// concatenates them in the order given. Completion rejects part lists that
// are not strictly ascending or that name a token this store never issued.
class MemoryObjectStore : public IDestination {
public:
    /// @param min_part_size  value reported by MinPartSize()
    explicit MemoryObjectStore(uint64_t min_part_size = 0) : min_part_size_(min_part_size) {}

    std::string BeginMultipart(const std::string& key) override;
    PartToken UploadPart(const std::string& session, uint32_t part_number,
                         std::span<const std::byte> data) override;
    void CompleteMultipart(const std::string& session,
                           std::span<const PartToken> parts) override;
    void AbortMultipart(const std::string& session) override;
    void PutObject(const std::string& key, std::span<const std::byte> data) override;

    uint64_t MinPartSize() const override { return min_part_size_; }

    /// Bytes of a committed object, or nullopt if absent.
    std::optional<std::vector<std::byte>> GetObject(const std::string& key) const;

    /// Same as GetObject() but as text; empty if absent.
    std::string GetObjectText(const std::string& key) const;

    /// Committed keys in lexical order.
    std::vector<std::string> ListKeys() const;

    /// Sessions begun but neither completed nor aborted.
    size_t OpenSessionCount() const;

    size_t AbortedSessionCount() const;

private:
    struct Session {
        std::string key;
        std::map<uint32_t, std::pair<std::string, std::vector<std::byte>>> parts;
    };

    mutable std::mutex mutex_;
    uint64_t min_part_size_;
    uint64_t next_session_ = 1;
    size_t aborted_sessions_ = 0;
    std::map<std::string, Session> sessions_;
    std::map<std::string, std::vector<std::byte>> objects_;
};

}  // namespace xfer_pipe
