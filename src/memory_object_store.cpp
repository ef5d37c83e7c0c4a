// SPDX-License-Identifier: MIT

// src/memory_object_store.cpp
#include "xfer_pipe/memory_object_store.hpp"

#include <fmt/format.h>

#include "xfer_pipe/checksum.hpp"
#include "xfer_pipe/error.hpp"

namespace xfer_pipe {

std::string MemoryObjectStore::BeginMultipart(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = fmt::format("mem-{}", next_session_++);
    sessions_.emplace(id, Session{key, {}});
    return id;
}

PartToken MemoryObjectStore::UploadPart(const std::string& session, uint32_t part_number,
                                        std::span<const std::byte> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session);
    if (it == sessions_.end()) {
        throw SessionError(ErrorCode::InvalidState,
            fmt::format("Unknown multipart session '{}'", session));
    }
    if (part_number == 0 || part_number > MaxPartCount()) {
        throw TransferError(ErrorCode::PartUploadFailed,
            fmt::format("Part number {} out of range", part_number));
    }
    std::string etag = Sha256Hex(data);
    it->second.parts[part_number] = {etag, std::vector<std::byte>(data.begin(), data.end())};
    return PartToken{part_number, std::move(etag)};
}

void MemoryObjectStore::CompleteMultipart(const std::string& session,
                                          std::span<const PartToken> parts) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session);
    if (it == sessions_.end()) {
        throw SessionError(ErrorCode::SessionCompleteFailed,
            fmt::format("Unknown multipart session '{}'", session));
    }
    if (parts.empty()) {
        throw SessionError(ErrorCode::SessionCompleteFailed,
            "Multipart completion requires at least one part");
    }

    std::vector<std::byte> body;
    uint32_t previous = 0;
    for (const auto& part : parts) {
        if (part.part_number <= previous) {
            throw SessionError(ErrorCode::SessionCompleteFailed,
                fmt::format("Parts not in ascending order at part {}", part.part_number));
        }
        previous = part.part_number;
        auto stored = it->second.parts.find(part.part_number);
        if (stored == it->second.parts.end() || stored->second.first != part.token) {
            throw SessionError(ErrorCode::SessionCompleteFailed,
                fmt::format("Unknown token for part {}", part.part_number));
        }
        const auto& bytes = stored->second.second;
        body.insert(body.end(), bytes.begin(), bytes.end());
    }

    objects_[it->second.key] = std::move(body);
    sessions_.erase(it);
}

void MemoryObjectStore::AbortMultipart(const std::string& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(session) == 0) {
        throw SessionError(ErrorCode::SessionAbortFailed,
            fmt::format("Unknown multipart session '{}'", session));
    }
    ++aborted_sessions_;
}

void MemoryObjectStore::PutObject(const std::string& key, std::span<const std::byte> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] = std::vector<std::byte>(data.begin(), data.end());
}

std::optional<std::vector<std::byte>> MemoryObjectStore::GetObject(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

std::string MemoryObjectStore::GetObjectText(const std::string& key) const {
    auto bytes = GetObject(key);
    if (!bytes) return {};
    return std::string(reinterpret_cast<const char*>(bytes->data()), bytes->size());
}

std::vector<std::string> MemoryObjectStore::ListKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(objects_.size());
    for (const auto& [key, _] : objects_) keys.push_back(key);
    return keys;
}

size_t MemoryObjectStore::OpenSessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t MemoryObjectStore::AbortedSessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aborted_sessions_;
}

}  // namespace xfer_pipe
