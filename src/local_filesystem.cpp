// SPDX-License-Identifier: MIT

// src/local_filesystem.cpp
#include "xfer_pipe/local_filesystem.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include "xfer_pipe/checksum.hpp"
#include "xfer_pipe/logging.hpp"

namespace xfer_pipe {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kStagingDir = ".multipart";

std::chrono::system_clock::time_point ToSystemClock(fs::file_time_type t) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        fs::file_time_type::clock::to_sys(t));
}

ItemInfo StatItem(const fs::path& path) {
    std::error_code ec;
    ItemInfo item;
    item.name = path.filename().string();
    item.key = path.generic_string();
    item.size = fs::file_size(path, ec);
    if (ec) {
        throw ScanError(Error{ErrorCode::ScanFailed,
            fmt::format("Cannot stat '{}': {}", item.key, ec.message()), ec.value()});
    }
    item.modified = ToSystemClock(fs::last_write_time(path, ec));
    if (ec) {
        throw ScanError(Error{ErrorCode::ScanFailed,
            fmt::format("Cannot stat '{}': {}", item.key, ec.message()), ec.value()});
    }
    return item;
}

void WriteFile(const fs::path& path, std::span<const std::byte> data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (out) {
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    }
    if (!out) {
        int err = errno;
        throw TransferError(Error{ErrorCode::ObjectWriteFailed,
            fmt::format("Cannot write '{}': {}", path.string(), std::strerror(err)), err});
    }
}

std::vector<std::byte> ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        int err = errno;
        throw SessionError(Error{ErrorCode::SessionCompleteFailed,
            fmt::format("Cannot read '{}': {}", path.string(), std::strerror(err)), err});
    }
    std::vector<std::byte> data;
    std::vector<char> block(LocalFileSource::kReadBlockSize);
    while (in.read(block.data(), static_cast<std::streamsize>(block.size())) || in.gcount() > 0) {
        auto bytes = std::as_bytes(std::span<const char>(block.data(), static_cast<size_t>(in.gcount())));
        data.insert(data.end(), bytes.begin(), bytes.end());
    }
    return data;
}

std::string PartFileName(uint32_t part_number) {
    return fmt::format("part-{:05}", part_number);
}

}  // namespace

// LocalFileSource

NamespaceListing LocalFileSource::ListNamespace(const std::string& path) {
    std::error_code ec;
    fs::path dir(path);
    auto status = fs::status(dir, ec);
    if (ec || !fs::exists(status)) {
        throw ScanError(Error{ErrorCode::ScanFailed,
            fmt::format("Source path '{}' does not exist", path), ec.value()});
    }

    NamespaceListing listing;
    if (!fs::is_directory(status)) {
        listing.items.push_back(StatItem(dir));
        return listing;
    }

    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        throw ScanError(Error{ErrorCode::ScanFailed,
            fmt::format("Cannot list '{}': {}", path, ec.message()), ec.value()});
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

    for (const auto& entry : entries) {
        if (entry.is_directory(ec)) {
            listing.children.push_back(entry.path().generic_string());
        } else if (entry.is_regular_file(ec)) {
            listing.items.push_back(StatItem(entry.path()));
        }
    }
    return listing;
}

void LocalFileSource::Read(const ItemInfo& item, IByteSink& sink) {
    std::ifstream in(item.key, std::ios::binary);
    if (!in) {
        int err = errno;
        throw ScanError(Error{ErrorCode::SourceReadFailed,
            fmt::format("Cannot open '{}': {}", item.key, std::strerror(err)), err});
    }
    std::vector<char> block(kReadBlockSize);
    while (in.read(block.data(), static_cast<std::streamsize>(block.size())) || in.gcount() > 0) {
        sink.Write(std::as_bytes(std::span<const char>(block.data(),
                                                       static_cast<size_t>(in.gcount()))));
    }
    if (in.bad()) {
        throw ScanError(ErrorCode::SourceReadFailed,
            fmt::format("Read error on '{}'", item.key));
    }
}

// LocalObjectStore

LocalObjectStore::LocalObjectStore(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw ConfigurationError(Error{ErrorCode::InvalidConfiguration,
            fmt::format("Cannot create object store root '{}': {}", root_.string(), ec.message()),
            ec.value()});
    }
}

fs::path LocalObjectStore::PathFor(const std::string& key) const {
    return root_ / fs::path(key).relative_path();
}

fs::path LocalObjectStore::SessionDir(const std::string& session) const {
    return root_ / kStagingDir / session;
}

std::string LocalObjectStore::FindSession(const std::string& session, ErrorCode code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session);
    if (it == sessions_.end()) {
        throw SessionError(code, fmt::format("Unknown multipart session '{}'", session));
    }
    return it->second;
}

std::string LocalObjectStore::TakeSession(const std::string& session, ErrorCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session);
    if (it == sessions_.end()) {
        throw SessionError(code, fmt::format("Unknown multipart session '{}'", session));
    }
    std::string key = std::move(it->second);
    sessions_.erase(it);
    return key;
}

std::string LocalObjectStore::BeginMultipart(const std::string& key) {
    std::string session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = fmt::format("upload-{}", next_session_++);
        sessions_.emplace(session, key);
    }
    std::error_code ec;
    fs::create_directories(SessionDir(session), ec);
    if (ec) {
        TakeSession(session, ErrorCode::SessionBeginFailed);
        throw SessionError(Error{ErrorCode::SessionBeginFailed,
            fmt::format("Cannot create staging directory for '{}': {}", key, ec.message()),
            ec.value()});
    }
    return session;
}

PartToken LocalObjectStore::UploadPart(const std::string& session, uint32_t part_number,
                                       std::span<const std::byte> data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sessions_.contains(session)) {
            throw SessionError(ErrorCode::InvalidState,
                fmt::format("Unknown multipart session '{}'", session));
        }
    }
    try {
        WriteFile(SessionDir(session) / PartFileName(part_number), data);
    } catch (const TransferError& e) {
        throw TransferError(Error{ErrorCode::PartUploadFailed, e.what(), e.error().os_errno});
    }
    return PartToken{part_number, Sha256Hex(data)};
}

void LocalObjectStore::CompleteMultipart(const std::string& session,
                                         std::span<const PartToken> parts) {
    // The session stays registered until the rename lands, so a failed
    // completion can still be aborted.
    std::string key = FindSession(session, ErrorCode::SessionCompleteFailed);
    fs::path dir = SessionDir(session);
    fs::path target = PathFor(key);
    fs::path temp = target;
    temp += fmt::format(".{}.tmp", session);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    try {
        AssembleParts(dir, temp, key, parts);
        fs::rename(temp, target, ec);
        if (ec) {
            throw SessionError(Error{ErrorCode::SessionCompleteFailed,
                fmt::format("Cannot rename '{}' to '{}': {}", temp.string(), target.string(),
                            ec.message()), ec.value()});
        }
    } catch (const Exception&) {
        std::error_code remove_ec;
        fs::remove(temp, remove_ec);
        throw;
    }

    TakeSession(session, ErrorCode::SessionCompleteFailed);
    fs::remove_all(dir, ec);
    if (ec) {
        GetLogger()->warn("Cannot remove staging directory '{}': {}", dir.string(), ec.message());
    }
}

void LocalObjectStore::AssembleParts(const fs::path& dir, const fs::path& temp,
                                     const std::string& key,
                                     std::span<const PartToken> parts) const {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    uint32_t previous = 0;
    for (const auto& part : parts) {
        if (part.part_number <= previous) {
            throw SessionError(ErrorCode::SessionCompleteFailed,
                fmt::format("Parts not in ascending order at part {}", part.part_number));
        }
        previous = part.part_number;
        auto bytes = ReadFile(dir / PartFileName(part.part_number));
        if (Sha256Hex(bytes) != part.token) {
            throw SessionError(ErrorCode::SessionCompleteFailed,
                fmt::format("Token mismatch for part {} of '{}'", part.part_number, key));
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }
    if (!out) {
        throw SessionError(ErrorCode::SessionCompleteFailed,
            fmt::format("Cannot write '{}'", temp.string()));
    }
}

void LocalObjectStore::AbortMultipart(const std::string& session) {
    TakeSession(session, ErrorCode::SessionAbortFailed);
    std::error_code ec;
    fs::remove_all(SessionDir(session), ec);
    if (ec) {
        throw SessionError(Error{ErrorCode::SessionAbortFailed,
            fmt::format("Cannot remove staged parts of '{}': {}", session, ec.message()),
            ec.value()});
    }
}

void LocalObjectStore::PutObject(const std::string& key, std::span<const std::byte> data) {
    fs::path target = PathFor(key);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw TransferError(Error{ErrorCode::ObjectWriteFailed,
            fmt::format("Cannot create directory for '{}': {}", key, ec.message()), ec.value()});
    }
    fs::path temp = target;
    temp += ".tmp";
    WriteFile(temp, data);
    fs::rename(temp, target, ec);
    if (ec) {
        throw TransferError(Error{ErrorCode::ObjectWriteFailed,
            fmt::format("Cannot rename '{}': {}", temp.string(), ec.message()), ec.value()});
    }
}

}  // namespace xfer_pipe
