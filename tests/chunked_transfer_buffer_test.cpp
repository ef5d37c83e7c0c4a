// SPDX-License-Identifier: MIT

// tests/chunked_transfer_buffer_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "mock_destination.hpp"
#include "xfer_pipe/checksum.hpp"
#include "xfer_pipe/chunked_transfer_buffer.hpp"
#include "xfer_pipe/compression.hpp"
#include "xfer_pipe/error.hpp"
#include "xfer_pipe/logging.hpp"

using namespace xfer_pipe;
using xfer_pipe::testing::AsBytes;
using xfer_pipe::testing::FlakyObjectStore;
using xfer_pipe::testing::MockDestination;
using xfer_pipe::testing::ToString;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

ChunkedBufferConfig SplitConfig(uint64_t chunk_size, std::string key = "exports/data.csv") {
    ChunkedBufferConfig config;
    config.key = std::move(key);
    config.mode = TransferMode::MultiObjectSplit;
    config.chunk_size = chunk_size;
    config.num_workers = 3;
    config.retry = RetryConfig::None();
    return config;
}

ChunkedBufferConfig MultipartConfig(uint64_t chunk_size, std::string key = "exports/data.csv") {
    ChunkedBufferConfig config;
    config.key = std::move(key);
    config.mode = TransferMode::SingleObjectMultipart;
    config.chunk_size = chunk_size;
    config.num_workers = 3;
    config.retry = RetryConfig::None();
    return config;
}

// Holds every part upload until Release(), then fails it with a transient
// code.
class StalledObjectStore : public MemoryObjectStore {
public:
    PartToken UploadPart(const std::string&, uint32_t, std::span<const std::byte>) override {
        if (upload_calls.fetch_add(1) == 0) started_.set_value();
        release_.wait();
        throw TransferError(ErrorCode::Throttled, "slow down");
    }

    void WaitUntilStarted() { started_future_.wait(); }
    void Release() { release_promise_.set_value(); }

    std::atomic<int> upload_calls{0};

private:
    std::promise<void> started_;
    std::future<void> started_future_ = started_.get_future();
    std::promise<void> release_promise_;
    std::shared_future<void> release_ = release_promise_.get_future().share();
};

std::vector<uint32_t> PartIndices(const std::vector<TransferResult>& results) {
    std::vector<uint32_t> parts;
    for (const auto& r : results) parts.push_back(r.part_index);
    std::sort(parts.begin(), parts.end());
    return parts;
}

}  // namespace

TEST(ChunkedTransferBufferTest, SplitModeRepeatsHeaderOnEveryObject) {
    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, SplitConfig(std::string("h\nline1\n").size()));

    buffer.Write(std::string_view("h\nline1\nline2\n"));
    auto results = buffer.Close();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(PartIndices(results), (std::vector<uint32_t>{1, 2}));
    EXPECT_EQ(store.GetObjectText("exports/data_1.csv"), "h\nline1\n");
    EXPECT_EQ(store.GetObjectText("exports/data_2.csv"), "h\nline2\n");
    EXPECT_EQ(buffer.header(), "h\n");
    EXPECT_EQ(buffer.state(), ChunkedTransferBuffer::State::Closed);
}

TEST(ChunkedTransferBufferTest, MultipartSmallWriteUploadsOnePart) {
    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, MultipartConfig(1024));

    buffer.Write(std::string_view("content"));
    auto results = buffer.Close();

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].part_index, 1u);
    EXPECT_EQ(results[0].key, "exports/data.csv");
    EXPECT_EQ(results[0].size, 7u);
    EXPECT_EQ(results[0].sha256, Sha256Hex(AsBytes("content")));
    EXPECT_EQ(store.GetObjectText("exports/data.csv"), "content");
    EXPECT_EQ(store.OpenSessionCount(), 0u);
}

TEST(ChunkedTransferBufferTest, EmptyMultipartCommitsZeroByteObject) {
    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, MultipartConfig(1024));

    auto results = buffer.Close();

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].size, 0u);
    auto object = store.GetObject("exports/data.csv");
    ASSERT_TRUE(object.has_value());
    EXPECT_TRUE(object->empty());
    EXPECT_EQ(store.OpenSessionCount(), 0u);
}

TEST(ChunkedTransferBufferTest, EmptySplitWritesOneEmptyObject) {
    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, SplitConfig(16));

    auto results = buffer.Close();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(store.ListKeys(), (std::vector<std::string>{"exports/data_1.csv"}));
}

TEST(ChunkedTransferBufferTest, MultipartSplitsAtArbitraryBytes) {
    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, MultipartConfig(4));

    buffer.Write(std::string_view("0123456789"));
    auto results = buffer.Close();

    EXPECT_EQ(PartIndices(results), (std::vector<uint32_t>{1, 2, 3}));
    EXPECT_EQ(buffer.chunks_dispatched(), 3u);
    EXPECT_EQ(store.GetObjectText("exports/data.csv"), "0123456789");
}

TEST(ChunkedTransferBufferTest, CompletionReceivesPartsInAscendingOrder) {
    NiceMock<MockDestination> destination;
    ON_CALL(destination, MinPartSize()).WillByDefault(Return(0));
    ON_CALL(destination, MaxPartCount()).WillByDefault(Return(10000));
    EXPECT_CALL(destination, BeginMultipart("exports/data.csv")).WillOnce(Return("s-1"));
    ON_CALL(destination, UploadPart("s-1", _, _))
        .WillByDefault([](const std::string&, uint32_t part, std::span<const std::byte>) {
            // Earlier parts finish later
            std::this_thread::sleep_for(std::chrono::milliseconds(5 * (6 - part)));
            return PartToken{part, "etag-" + std::to_string(part)};
        });

    std::vector<PartToken> committed;
    EXPECT_CALL(destination, CompleteMultipart("s-1", _))
        .WillOnce([&](const std::string&, std::span<const PartToken> parts) {
            committed.assign(parts.begin(), parts.end());
        });

    auto config = MultipartConfig(2);
    config.num_workers = 5;
    ChunkedTransferBuffer buffer(destination, config);
    buffer.Write(std::string_view("aabbccddee"));
    buffer.Close();

    ASSERT_EQ(committed.size(), 5u);
    for (uint32_t i = 0; i < 5; ++i) {
        EXPECT_EQ(committed[i].part_number, i + 1);
        EXPECT_EQ(committed[i].token, "etag-" + std::to_string(i + 1));
    }
}

TEST(ChunkedTransferBufferTest, SplitPartsReconstructOriginalStream) {
    std::string header = "id,name,amount\n";
    std::string input = header;
    for (int i = 0; i < 200; ++i) {
        input += std::to_string(i) + ",name" + std::string(static_cast<size_t>(i % 13), 'x') +
                 "," + std::to_string(i * 7) + "\n";
    }

    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, SplitConfig(64));
    // Uneven write sizes
    for (size_t pos = 0; pos < input.size(); pos += 37) {
        buffer.Write(std::string_view(input).substr(pos, 37));
    }
    auto results = buffer.Close();
    ASSERT_GT(results.size(), 2u);

    std::string rebuilt;
    for (uint32_t part = 1; part <= results.size(); ++part) {
        std::string body = store.GetObjectText("exports/data_" + std::to_string(part) + ".csv");
        ASSERT_FALSE(body.empty());
        EXPECT_EQ(body.back(), '\n') << "part " << part << " does not end on a line";
        if (part > 1) {
            ASSERT_EQ(body.substr(0, header.size()), header);
            body = body.substr(header.size());
        }
        rebuilt += body;
    }
    EXPECT_EQ(rebuilt, input);
}

TEST(ChunkedTransferBufferTest, RecordLongerThanChunkSplitsAtNextTerminator) {
    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, SplitConfig(8));

    buffer.Write(std::string_view("abcdefghijk\nxyzxyz"));
    buffer.Close();

    EXPECT_EQ(store.GetObjectText("exports/data_1.csv"), "abcdefghijk\n");
    EXPECT_EQ(store.GetObjectText("exports/data_2.csv"), "abcdefghijk\nxyzxyz");
}

TEST(ChunkedTransferBufferTest, OversizeRecordFailsByDefault) {
    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, SplitConfig(8));

    try {
        buffer.Write(std::string_view("aaaaaaaaaaaaaaaaaaaa"));
        FAIL() << "expected RecordTooLarge";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RecordTooLarge);
    }
    buffer.Abort();
    EXPECT_EQ(buffer.state(), ChunkedTransferBuffer::State::Aborted);
    EXPECT_TRUE(store.ListKeys().empty());
}

TEST(ChunkedTransferBufferTest, OversizeRecordForceSplit) {
    MemoryObjectStore store;
    auto config = SplitConfig(8);
    config.oversize_policy = OversizeRecordPolicy::ForceSplit;
    ChunkedTransferBuffer buffer(store, config);

    buffer.Write(std::string_view("aaaaaaaaaaaaaaaaaaaa"));
    buffer.Close();

    EXPECT_EQ(store.GetObjectText("exports/data_1.csv"), std::string(8, 'a'));
    EXPECT_EQ(store.GetObjectText("exports/data_2.csv"), std::string(12, 'a'));
    EXPECT_TRUE(buffer.header().empty());
}

TEST(ChunkedTransferBufferTest, MultipartCompressionUsesFixedKeyAndDecodes) {
    std::string input;
    for (int i = 0; i < 500; ++i) input += "row " + std::to_string(i) + "\n";

    MemoryObjectStore store;
    auto config = MultipartConfig(256);
    config.compression = CompressionSpec{};
    ChunkedTransferBuffer buffer(store, config);
    EXPECT_EQ(buffer.effective_key(), "exports/data.csv.zst");

    buffer.Write(std::string_view(input));
    auto results = buffer.Close();

    uint64_t raw = 0;
    for (const auto& r : results) {
        EXPECT_TRUE(r.compressed);
        EXPECT_EQ(r.key, "exports/data.csv.zst");
        raw += r.raw_size;
    }
    EXPECT_EQ(raw, input.size());

    auto object = store.GetObject("exports/data.csv.zst");
    ASSERT_TRUE(object.has_value());
    EXPECT_EQ(ToString(ZstdDecompress(*object)), input);
    EXPECT_FALSE(store.GetObject("exports/data.csv").has_value());
}

TEST(ChunkedTransferBufferTest, SplitCompressionAppendsExtensionPerObject) {
    MemoryObjectStore store;
    auto config = SplitConfig(8);
    config.compression = CompressionSpec{.level = 1};
    ChunkedTransferBuffer buffer(store, config);

    buffer.Write(std::string_view("h\nline1\nline2\n"));
    buffer.Close();

    EXPECT_EQ(store.ListKeys(),
              (std::vector<std::string>{"exports/data_1.csv.zst", "exports/data_2.csv.zst"}));
    auto second = store.GetObject("exports/data_2.csv.zst");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(ToString(ZstdDecompress(*second)), "h\nline2\n");
}

TEST(ChunkedTransferBufferTest, SecondCloseThrowsInvalidState) {
    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, MultipartConfig(16));
    buffer.Write(std::string_view("x"));
    buffer.Close();

    try {
        buffer.Close();
        FAIL() << "expected InvalidState";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidState);
    }
    EXPECT_THROW(buffer.Write(std::string_view("y")), SessionError);
}

TEST(ChunkedTransferBufferTest, AbortAfterCloseIsNoOp) {
    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, MultipartConfig(16));
    buffer.Write(std::string_view("x"));
    buffer.Close();

    buffer.Abort();
    EXPECT_EQ(buffer.state(), ChunkedTransferBuffer::State::Closed);
    EXPECT_EQ(store.AbortedSessionCount(), 0u);
    EXPECT_EQ(store.GetObjectText("exports/data.csv"), "x");
}

TEST(ChunkedTransferBufferTest, AbortDiscardsSessionAndIsIdempotent) {
    MemoryObjectStore store;
    ChunkedTransferBuffer buffer(store, MultipartConfig(4));
    buffer.Write(std::string_view("0123456789abcdef"));

    buffer.Abort();
    buffer.Abort();

    EXPECT_EQ(store.OpenSessionCount(), 0u);
    EXPECT_EQ(store.AbortedSessionCount(), 1u);
    EXPECT_TRUE(store.ListKeys().empty());
    EXPECT_THROW(buffer.Close(), SessionError);
}

TEST(ChunkedTransferBufferTest, AbortFailureSurfacesAsSessionError) {
    NiceMock<MockDestination> destination;
    ON_CALL(destination, MaxPartCount()).WillByDefault(Return(10000));
    ON_CALL(destination, BeginMultipart(_)).WillByDefault(Return("s-9"));
    ON_CALL(destination, UploadPart(_, _, _))
        .WillByDefault([](const std::string&, uint32_t part, std::span<const std::byte>) {
            return PartToken{part, "t"};
        });
    EXPECT_CALL(destination, AbortMultipart("s-9"))
        .WillOnce([](const std::string&) {
            throw SessionError(ErrorCode::DestinationUnavailable, "endpoint down");
        });

    ChunkedTransferBuffer buffer(destination, MultipartConfig(2));
    buffer.Write(std::string_view("abcd"));

    try {
        buffer.Abort();
        FAIL() << "expected SessionAbortFailed";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SessionAbortFailed);
    }
    EXPECT_EQ(buffer.state(), ChunkedTransferBuffer::State::Aborted);
    EXPECT_NO_THROW(buffer.Abort());
}

TEST(ChunkedTransferBufferTest, AbortStopsRetryingInFlightUpload) {
    StalledObjectStore store;
    auto config = MultipartConfig(4);
    config.retry = RetryConfig{
        .max_retries = 5,
        .initial_delay = std::chrono::milliseconds(200),
        .jitter_factor = 0.0,
    };

    auto begin = std::chrono::steady_clock::now();
    {
        ChunkedTransferBuffer buffer(store, config);
        buffer.Write(std::string_view("abcd"));
        store.WaitUntilStarted();
        buffer.Abort();
        store.Release();
    }
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(store.upload_calls.load(), 1);
    EXPECT_EQ(store.AbortedSessionCount(), 1u);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(ChunkedTransferBufferTest, UploadFailureRaisedFromClose) {
    FlakyObjectStore store;
    store.FailPart(2, ErrorCode::PartUploadFailed);
    ChunkedTransferBuffer buffer(store, MultipartConfig(4));

    try {
        // Depending on timing the failure surfaces from Write() or Close()
        buffer.Write(std::string_view("aaaabbbbcccc"));
        buffer.Close();
        FAIL() << "expected the part 2 failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PartUploadFailed);
    }

    buffer.Abort();
    EXPECT_EQ(store.OpenSessionCount(), 0u);
    EXPECT_TRUE(store.ListKeys().empty());
}

TEST(ChunkedTransferBufferTest, WriteFailsFastAfterUploadFailure) {
    FlakyObjectStore store;
    store.FailKey("exports/data_1.csv", ErrorCode::ObjectWriteFailed);
    ChunkedTransferBuffer buffer(store, SplitConfig(4));

    bool raised = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!raised && std::chrono::steady_clock::now() < deadline) {
        try {
            buffer.Write(std::string_view("abc\n"));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        } catch (const TransferError& e) {
            EXPECT_EQ(e.code(), ErrorCode::ObjectWriteFailed);
            raised = true;
        }
    }
    EXPECT_TRUE(raised);
    buffer.Abort();
}

TEST(ChunkedTransferBufferTest, TransientFailureRetried) {
    FlakyObjectStore store;
    store.FailPart(1, ErrorCode::Throttled, 2);
    auto config = MultipartConfig(16);
    config.retry = RetryConfig{
        .max_retries = 3,
        .initial_delay = std::chrono::milliseconds(1),
        .max_delay = std::chrono::milliseconds(5),
        .jitter_factor = 0.0,
    };
    ChunkedTransferBuffer buffer(store, config);

    buffer.Write(std::string_view("payload"));
    buffer.Close();

    EXPECT_EQ(store.upload_calls.load(), 3);
    EXPECT_EQ(store.GetObjectText("exports/data.csv"), "payload");
}

TEST(ChunkedTransferBufferTest, PermanentFailureNotRetried) {
    FlakyObjectStore store;
    store.FailPart(1, ErrorCode::InvalidState, 5);
    auto config = MultipartConfig(16);
    config.retry = RetryConfig{.max_retries = 3, .initial_delay = std::chrono::milliseconds(1)};
    ChunkedTransferBuffer buffer(store, config);

    buffer.Write(std::string_view("payload"));
    EXPECT_THROW(buffer.Close(), TransferError);
    EXPECT_EQ(store.upload_calls.load(), 1);
    buffer.Abort();
}

TEST(ChunkedTransferBufferTest, InvalidConfigurationRejected) {
    MemoryObjectStore store(5 * 1024 * 1024);

    auto zero_chunk = MultipartConfig(0);
    EXPECT_THROW((ChunkedTransferBuffer{store, zero_chunk}), ConfigurationError);

    auto no_workers = MultipartConfig(8 * 1024 * 1024);
    no_workers.num_workers = 0;
    EXPECT_THROW((ChunkedTransferBuffer{store, no_workers}), ConfigurationError);

    auto no_key = MultipartConfig(8 * 1024 * 1024, "");
    EXPECT_THROW((ChunkedTransferBuffer{store, no_key}), ConfigurationError);

    auto below_min = MultipartConfig(1024);
    EXPECT_THROW((ChunkedTransferBuffer{store, below_min}), ConfigurationError);

    // Split objects are standalone; the part minimum does not apply
    EXPECT_NO_THROW((ChunkedTransferBuffer{store, SplitConfig(1024)}));
}

TEST(ChunkedTransferBufferTest, ProgressLoggedAtEachTenPercent) {
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256);
    auto logger = std::make_shared<spdlog::logger>("progress-test", sink);
    logger->set_pattern("%v");
    SetLogger(logger);

    MemoryObjectStore store;
    auto config = MultipartConfig(10);
    config.total_size = 100;
    ChunkedTransferBuffer buffer(store, config);
    for (int i = 0; i < 10; ++i) buffer.Write(std::string(10, 'x'));
    // Overshoot must not report past 100%
    buffer.Write(std::string_view("extra"));
    buffer.Close();
    SetLogger(nullptr);

    std::vector<std::string> progress;
    for (const auto& line : sink->last_formatted()) {
        if (line.find("Progress for") != std::string::npos) progress.push_back(line);
    }
    ASSERT_EQ(progress.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_NE(progress[i].find(std::to_string((i + 1) * 10) + "%"), std::string::npos)
            << progress[i];
    }
}
