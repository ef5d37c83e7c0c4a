// SPDX-License-Identifier: MIT

// include/xfer_pipe/local_filesystem.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <span>
#include <string>

#include "xfer_pipe/destination.hpp"
#include "xfer_pipe/error.hpp"
#include "xfer_pipe/source.hpp"

namespace xfer_pipe {

/// FileSource over a local directory tree. Entries are listed in name
/// order; Read() streams a file in fixed-size blocks.
class LocalFileSource : public FileSource {
public:
    static constexpr size_t kReadBlockSize = 1024 * 1024;

    void Read(const ItemInfo& item, IByteSink& sink) override;

protected:
    NamespaceListing ListNamespace(const std::string& path) override;
};

// LocalObjectStore - IDestination backed by a directory.
//
// Keys map to paths below the root. Multipart parts are staged under
// <root>/.multipart/<session>/; completion concatenates them in the given
// order into a temporary file and renames it over the target.
class LocalObjectStore : public IDestination {
public:
    /// @throws ConfigurationError if the root cannot be created
    explicit LocalObjectStore(std::filesystem::path root);

    std::string BeginMultipart(const std::string& key) override;
    PartToken UploadPart(const std::string& session, uint32_t part_number,
                         std::span<const std::byte> data) override;
    void CompleteMultipart(const std::string& session,
                           std::span<const PartToken> parts) override;
    void AbortMultipart(const std::string& session) override;
    void PutObject(const std::string& key, std::span<const std::byte> data) override;

    const std::filesystem::path& root() const { return root_; }

    /// Filesystem path for `key`.
    std::filesystem::path PathFor(const std::string& key) const;

private:
    std::filesystem::path SessionDir(const std::string& session) const;
    std::string FindSession(const std::string& session, ErrorCode code) const;
    std::string TakeSession(const std::string& session, ErrorCode code);
    void AssembleParts(const std::filesystem::path& dir, const std::filesystem::path& temp,
                       const std::string& key, std::span<const PartToken> parts) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    uint64_t next_session_ = 1;
    std::map<std::string, std::string> sessions_;   ///< session id -> key
};

}  // namespace xfer_pipe
