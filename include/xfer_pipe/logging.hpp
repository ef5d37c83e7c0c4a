// SPDX-License-Identifier: MIT

// include/xfer_pipe/logging.hpp
#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace xfer_pipe {

/// Name of the library-wide logger.
inline constexpr std::string_view kLoggerName = "xfer_pipe";

/// Return the library logger, creating a stderr color logger on first use.
std::shared_ptr<spdlog::logger> GetLogger();

/// Replace the library logger (e.g. with a ringbuffer sink in tests).
/// Passing nullptr restores the default logger.
void SetLogger(std::shared_ptr<spdlog::logger> logger);

/// Log a structured failure line: operation, destination key, and cause.
void LogFailure(spdlog::logger& logger, std::string_view operation,
                std::string_view key, std::string_view cause);

}  // namespace xfer_pipe
