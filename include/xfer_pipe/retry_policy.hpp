// SPDX-License-Identifier: MIT

// include/xfer_pipe/retry_policy.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <random>
#include <thread>
#include <utility>

#include "xfer_pipe/error.hpp"

namespace xfer_pipe {

/// Backoff settings for part and object uploads.
struct RetryConfig {
    uint32_t max_retries = 3;                          ///< Retries after the first attempt
    std::chrono::milliseconds initial_delay{200};
    std::chrono::milliseconds max_delay{10000};
    double backoff_multiplier = 2.0;
    double jitter_factor = 0.1;                        ///< +/- fraction applied to each delay

    static RetryConfig UploadDefaults() {
        return RetryConfig{
            .max_retries = 3,
            .initial_delay = std::chrono::milliseconds{500},
            .max_delay = std::chrono::milliseconds{15000},
            .backoff_multiplier = 2.0,
            .jitter_factor = 0.1,
        };
    }

    /// Fail on the first error.
    static RetryConfig None() {
        return RetryConfig{.max_retries = 0};
    }
};

// RetryPolicy - retry budget for one upload.
//
// NextDelay() classifies the failure and, when another attempt is allowed,
// consumes one retry and returns how long to back off. Only transient
// destination and write failures are retried; configuration, session and
// data errors are returned to the caller on the first occurrence.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {})
        : config_(config), rng_(std::random_device{}()) {}

    /// True for failures worth another attempt.
    static bool IsRetryable(ErrorCode code) {
        switch (code) {
            case ErrorCode::DestinationUnavailable:
            case ErrorCode::Throttled:
            case ErrorCode::PartUploadFailed:
            case ErrorCode::ObjectWriteFailed:
                return true;
            default:
                return false;
        }
    }

    /// @return the backoff before the next attempt, or nullopt if `error`
    ///         is permanent or the retry budget is spent
    std::optional<std::chrono::milliseconds> NextDelay(const Error& error) {
        if (!IsRetryable(error.code) || retries_ >= config_.max_retries) {
            return std::nullopt;
        }
        auto delay = Backoff(retries_);
        ++retries_;
        return delay;
    }

    /// Delay for retry number `retry` (0-based): initial_delay *
    /// multiplier^retry, capped at max_delay, then jittered.
    std::chrono::milliseconds Backoff(uint32_t retry) {
        double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                          std::pow(config_.backoff_multiplier, static_cast<double>(retry));
        delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));
        if (config_.jitter_factor > 0.0) {
            std::uniform_real_distribution<> jitter(1.0 - config_.jitter_factor,
                                                    1.0 + config_.jitter_factor);
            delay_ms *= jitter(rng_);
        }
        return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
    }

    /// Invoke `fn` until it returns, retrying xfer_pipe exceptions that
    /// NextDelay() accepts. `on_retry(error, delay, retry_number)` runs
    /// before each backoff sleep. The last exception propagates unchanged.
    template <typename Fn, typename OnRetry>
    auto Run(Fn&& fn, OnRetry&& on_retry) {
        return Run(std::forward<Fn>(fn), std::forward<OnRetry>(on_retry), [] { return false; });
    }

    /// As above, but gives up and rethrows as soon as `stop()` returns true.
    /// `stop` is polled after each failure and during the backoff sleep.
    template <typename Fn, typename OnRetry, typename Stop>
    auto Run(Fn&& fn, OnRetry&& on_retry, Stop&& stop) {
        for (;;) {
            try {
                return fn();
            } catch (const Exception& e) {
                if (stop()) throw;
                auto delay = NextDelay(e.error());
                if (!delay) throw;
                on_retry(e, *delay, retries_);
                if (!SleepUnlessStopped(*delay, stop)) throw;
            }
        }
    }

    /// Retries consumed so far.
    uint32_t Retries() const { return retries_; }

    const RetryConfig& config() const { return config_; }

private:
    static constexpr std::chrono::milliseconds kStopPollInterval{20};

    // False if `stop()` turned true before `delay` elapsed.
    template <typename Stop>
    static bool SleepUnlessStopped(std::chrono::milliseconds delay, Stop& stop) {
        auto deadline = std::chrono::steady_clock::now() + delay;
        for (;;) {
            if (stop()) return false;
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return true;
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(deadline - now, kStopPollInterval));
        }
    }

    RetryConfig config_;
    uint32_t retries_ = 0;
    std::mt19937 rng_;
};

}  // namespace xfer_pipe
