// SPDX-License-Identifier: MIT

// include/xfer_pipe/error.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace xfer_pipe {

/// Error codes for all scan, transfer, and session operations.
enum class ErrorCode {
    // Scan
    ScanFailed,              ///< Source namespace could not be listed
    SourceReadFailed,        ///< Item bytes could not be read from the source

    // Transfer
    PartUploadFailed,        ///< upload-part call failed
    ObjectWriteFailed,       ///< put-object call failed
    RecordTooLarge,          ///< No line terminator within 2x chunk size
    CompressionFailed,       ///< zstd compression failed
    StreamFailed,            ///< One or more parallel stream consumers failed

    // Session
    SessionBeginFailed,      ///< begin-multipart call failed
    SessionCompleteFailed,   ///< complete-multipart call failed
    SessionAbortFailed,      ///< abort-multipart call failed
    InvalidState,            ///< Method called in wrong lifecycle state

    // Destination (transient)
    DestinationUnavailable,  ///< Destination temporarily unreachable
    Throttled,               ///< Destination asked the caller to slow down

    // Configuration
    InvalidConfiguration,    ///< Inconsistent chunk size, mode, or worker count
    UnknownOperator,         ///< No operator registered for (source, target)

    // Query source
    QueryFailed,             ///< SQL statement or cursor fetch failed
    ConnectionFailed,        ///< Database connection could not be established
};

/// Error payload carried by every xfer_pipe exception.
struct Error {
    ErrorCode code;          ///< Classified error code
    std::string message;     ///< Human-readable description
    int os_errno = 0;        ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "scan", "session").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::ScanFailed:
        case ErrorCode::SourceReadFailed:
            return "scan";
        case ErrorCode::PartUploadFailed:
        case ErrorCode::ObjectWriteFailed:
        case ErrorCode::RecordTooLarge:
        case ErrorCode::CompressionFailed:
        case ErrorCode::StreamFailed:
            return "transfer";
        case ErrorCode::SessionBeginFailed:
        case ErrorCode::SessionCompleteFailed:
        case ErrorCode::SessionAbortFailed:
        case ErrorCode::InvalidState:
            return "session";
        case ErrorCode::DestinationUnavailable:
        case ErrorCode::Throttled:
            return "destination";
        case ErrorCode::InvalidConfiguration:
        case ErrorCode::UnknownOperator:
            return "configuration";
        case ErrorCode::QueryFailed:
        case ErrorCode::ConnectionFailed:
            return "database";
    }
    return "unknown";
}

/// Base exception for the library. Carries the classified Error.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    Exception(ErrorCode code, std::string message)
        : Exception(Error{code, std::move(message)}) {}

    const Error& error() const noexcept { return error_; }
    ErrorCode code() const noexcept { return error_.code; }

private:
    Error error_;
};

/// Listing or reading the source failed.
class ScanError : public Exception {
public:
    using Exception::Exception;
};

/// A chunk upload or object write failed.
class TransferError : public Exception {
public:
    using Exception::Exception;
};

/// begin/complete/abort of a multi-part session failed, or lifecycle misuse.
class SessionError : public Exception {
public:
    using Exception::Exception;
};

/// Inconsistent chunk size, mode, or other configuration.
class ConfigurationError : public Exception {
public:
    using Exception::Exception;
};

}  // namespace xfer_pipe
