// SPDX-License-Identifier: MIT

// src/logging.cpp
#include "xfer_pipe/logging.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace xfer_pipe {

namespace {

std::mutex& LoggerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& LoggerSlot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

std::shared_ptr<spdlog::logger> MakeDefaultLogger() {
    std::string name{kLoggerName};
    if (auto existing = spdlog::get(name)) return existing;
    return spdlog::stderr_color_mt(name);
}

}  // namespace

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(LoggerMutex());
    auto& slot = LoggerSlot();
    if (!slot) slot = MakeDefaultLogger();
    return slot;
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(LoggerMutex());
    LoggerSlot() = logger ? std::move(logger) : MakeDefaultLogger();
}

void LogFailure(spdlog::logger& logger, std::string_view operation,
                std::string_view key, std::string_view cause) {
    logger.error("operation={} key={} cause={}", operation, key, cause);
}

}  // namespace xfer_pipe
