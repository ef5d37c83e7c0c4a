// SPDX-License-Identifier: MIT

// include/xfer_pipe/destination.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace xfer_pipe {

/// Confirmation of one uploaded part, returned by UploadPart().
struct PartToken {
    uint32_t part_number = 0;   ///< 1-based part index
    std::string token;          ///< Destination-assigned confirmation (e.g. ETag)

    bool operator==(const PartToken&) const = default;
};

/// Abstract object-store destination.
///
/// Implementations must be safe to call from several upload workers at
/// once. Failures are reported by throwing: SessionError for session
/// lifecycle calls, TransferError for part and object writes. Transient
/// failures should use ErrorCode::DestinationUnavailable or
/// ErrorCode::Throttled so the caller can retry them.
class IDestination {
public:
    virtual ~IDestination() = default;

    /// Open a multi-part write session for `key`.
    /// @return destination-assigned session id
    virtual std::string BeginMultipart(const std::string& key) = 0;

    /// Upload one part of an open session. Parts may arrive in any order.
    /// @param part_number  1-based part index
    /// @return confirmation token for CompleteMultipart()
    /// @throws SessionError(InvalidState) if the session is unknown or was
    ///         aborted
    virtual PartToken UploadPart(const std::string& session, uint32_t part_number,
                                 std::span<const std::byte> data) = 0;

    /// Commit the session. `parts` is sorted by ascending part_number.
    virtual void CompleteMultipart(const std::string& session,
                                   std::span<const PartToken> parts) = 0;

    /// Discard the session and any uploaded parts. No object persists.
    virtual void AbortMultipart(const std::string& session) = 0;

    /// Write a whole object in one call, replacing any existing object.
    virtual void PutObject(const std::string& key, std::span<const std::byte> data) = 0;

    /// Smallest allowed part (except the last); 0 means no minimum.
    virtual uint64_t MinPartSize() const { return 0; }

    /// Largest part number a session accepts.
    virtual uint32_t MaxPartCount() const { return 10000; }
};

}  // namespace xfer_pipe
