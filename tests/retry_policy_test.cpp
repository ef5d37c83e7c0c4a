// SPDX-License-Identifier: MIT

// tests/retry_policy_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <vector>

#include "xfer_pipe/error.hpp"
#include "xfer_pipe/retry_policy.hpp"

using namespace xfer_pipe;
using namespace std::chrono_literals;

namespace {

RetryConfig FastConfig(uint32_t max_retries) {
    return RetryConfig{
        .max_retries = max_retries,
        .initial_delay = 1ms,
        .max_delay = 4ms,
        .backoff_multiplier = 2.0,
        .jitter_factor = 0.0,
    };
}

}  // namespace

TEST(RetryPolicyTest, TransientCodesAreRetryable) {
    EXPECT_TRUE(RetryPolicy::IsRetryable(ErrorCode::DestinationUnavailable));
    EXPECT_TRUE(RetryPolicy::IsRetryable(ErrorCode::Throttled));
    EXPECT_TRUE(RetryPolicy::IsRetryable(ErrorCode::PartUploadFailed));
    EXPECT_TRUE(RetryPolicy::IsRetryable(ErrorCode::ObjectWriteFailed));
}

TEST(RetryPolicyTest, PermanentCodesAreNot) {
    EXPECT_FALSE(RetryPolicy::IsRetryable(ErrorCode::InvalidConfiguration));
    EXPECT_FALSE(RetryPolicy::IsRetryable(ErrorCode::InvalidState));
    EXPECT_FALSE(RetryPolicy::IsRetryable(ErrorCode::RecordTooLarge));
    EXPECT_FALSE(RetryPolicy::IsRetryable(ErrorCode::SessionCompleteFailed));
    EXPECT_FALSE(RetryPolicy::IsRetryable(ErrorCode::CompressionFailed));
}

TEST(RetryPolicyTest, DelaysDoubleUntilCap) {
    RetryPolicy policy(RetryConfig{
        .max_retries = 5,
        .initial_delay = 100ms,
        .max_delay = 500ms,
        .backoff_multiplier = 2.0,
        .jitter_factor = 0.0,
    });
    Error e{ErrorCode::Throttled, "slow down"};

    std::vector<int64_t> delays;
    while (auto delay = policy.NextDelay(e)) delays.push_back(delay->count());
    EXPECT_EQ(delays, (std::vector<int64_t>{100, 200, 400, 500, 500}));
    EXPECT_EQ(policy.Retries(), 5u);
}

TEST(RetryPolicyTest, PermanentErrorConsumesNoBudget) {
    RetryPolicy policy(FastConfig(2));
    EXPECT_FALSE(policy.NextDelay(Error{ErrorCode::RecordTooLarge, "huge"}).has_value());
    EXPECT_EQ(policy.Retries(), 0u);
    EXPECT_TRUE(policy.NextDelay(Error{ErrorCode::PartUploadFailed, "reset"}).has_value());
}

TEST(RetryPolicyTest, JitterStaysInRange) {
    RetryPolicy policy(RetryConfig{.initial_delay = 1000ms, .jitter_factor = 0.1});
    for (int i = 0; i < 20; ++i) {
        auto delay = policy.Backoff(0);
        EXPECT_GE(delay.count(), 900);
        EXPECT_LE(delay.count(), 1100);
    }
}

TEST(RetryPolicyTest, NonePresetNeverRetries) {
    RetryPolicy policy(RetryConfig::None());
    EXPECT_FALSE(policy.NextDelay(Error{ErrorCode::Throttled, "slow down"}).has_value());
}

TEST(RetryPolicyTest, UploadDefaults) {
    auto config = RetryConfig::UploadDefaults();
    EXPECT_EQ(config.max_retries, 3u);
    EXPECT_EQ(config.initial_delay.count(), 500);
    EXPECT_EQ(config.max_delay.count(), 15000);
}

TEST(RetryPolicyTest, RunRetriesTransientFailures) {
    RetryPolicy policy(FastConfig(3));
    int calls = 0;
    std::vector<uint32_t> retries;

    int value = policy.Run(
        [&] {
            if (++calls < 3) throw TransferError(ErrorCode::DestinationUnavailable, "503");
            return 42;
        },
        [&](const Exception&, std::chrono::milliseconds, uint32_t retry) {
            retries.push_back(retry);
        });

    EXPECT_EQ(value, 42);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(retries, (std::vector<uint32_t>{1, 2}));
}

TEST(RetryPolicyTest, RunRethrowsWhenBudgetSpent) {
    RetryPolicy policy(FastConfig(2));
    int calls = 0;
    try {
        policy.Run(
            [&] {
                ++calls;
                throw TransferError(ErrorCode::PartUploadFailed, "reset");
            },
            [](const Exception&, std::chrono::milliseconds, uint32_t) {});
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PartUploadFailed);
    }
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, RunDoesNotRetryPermanentFailure) {
    RetryPolicy policy(FastConfig(3));
    int calls = 0;
    int notified = 0;
    EXPECT_THROW(policy.Run(
                     [&] {
                         ++calls;
                         throw SessionError(ErrorCode::InvalidState, "closed");
                     },
                     [&](const Exception&, std::chrono::milliseconds, uint32_t) { ++notified; }),
                 SessionError);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(notified, 0);
}

TEST(RetryPolicyTest, RunStopsDuringBackoff) {
    RetryPolicy policy(RetryConfig{
        .max_retries = 3,
        .initial_delay = 10s,
        .max_delay = 10s,
        .jitter_factor = 0.0,
    });
    int calls = 0;
    std::atomic<bool> stopped{false};

    auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(policy.Run(
                     [&] {
                         ++calls;
                         throw TransferError(ErrorCode::Throttled, "slow down");
                     },
                     [&](const Exception&, std::chrono::milliseconds, uint32_t) { stopped = true; },
                     [&] { return stopped.load(); }),
                 TransferError);
    EXPECT_EQ(calls, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
}

TEST(RetryPolicyTest, RunDoesNotRetryOnceStopped) {
    RetryPolicy policy(FastConfig(3));
    int calls = 0;
    EXPECT_THROW(policy.Run(
                     [&] {
                         ++calls;
                         throw TransferError(ErrorCode::DestinationUnavailable, "503");
                     },
                     [](const Exception&, std::chrono::milliseconds, uint32_t) {},
                     [] { return true; }),
                 TransferError);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(policy.Retries(), 0u);
}
