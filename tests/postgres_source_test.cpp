// SPDX-License-Identifier: MIT

// tests/postgres_source_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mock_libpq.hpp"
#include "xfer_pipe/error.hpp"
#include "xfer_pipe/postgres_source.hpp"

using namespace xfer_pipe;
using xfer_pipe::testing::MockLibPq;
using xfer_pipe::testing::SimulatedLibPq;
using ::testing::_;
using ::testing::Return;
using ::testing::StrEq;

namespace {

PostgresConfig TestConfig() {
    PostgresConfig config;
    config.host = "db.internal";
    config.port = 5433;
    config.database = "sales";
    config.user = "reader";
    config.password = "s3cret";
    return config;
}

}  // namespace

TEST(PostgresConfigTest, ConnectionString) {
    EXPECT_EQ(TestConfig().connection_string(),
              "host=db.internal port=5433 dbname=sales user=reader password=s3cret");
}

TEST(PostgresConfigTest, QuotesSpecialValues) {
    PostgresConfig config = TestConfig();
    config.password = "it's a secret";
    config.user = "";
    EXPECT_EQ(config.connection_string(),
              "host=db.internal port=5433 dbname=sales user='' password='it\\'s a secret'");
}

TEST(PostgresQuerySourceTest, OpenDeclaresCursorInTransaction) {
    SimulatedLibPq pq;
    PostgresQuerySource source(TestConfig(), pq);
    source.Open("SELECT id FROM orders");

    EXPECT_TRUE(source.is_connected());
    EXPECT_TRUE(source.is_open());
    EXPECT_EQ(pq.statements(), (std::vector<std::string>{
        "BEGIN",
        "DECLARE xfer_pipe_cursor NO SCROLL CURSOR FOR SELECT id FROM orders",
    }));
}

TEST(PostgresQuerySourceTest, FetchesBatchesUntilExhausted) {
    SimulatedLibPq pq;
    pq.set_columns({"id", "note"});
    pq.queue_batch({{"1", "first"}, {"2", std::nullopt}});
    pq.queue_batch({{"3", "third"}});

    PostgresQuerySource source(TestConfig(), pq);
    source.Open("SELECT id, note FROM orders");

    auto first = source.FetchBatch(2);
    EXPECT_EQ(first.columns, (std::vector<std::string>{"id", "note"}));
    ASSERT_EQ(first.rows.size(), 2u);
    EXPECT_EQ(first.rows[0][1], "first");
    EXPECT_FALSE(first.rows[1][1].has_value());

    auto second = source.FetchBatch(2);
    ASSERT_EQ(second.rows.size(), 1u);
    EXPECT_EQ(second.rows[0][0], "3");

    auto last = source.FetchBatch(2);
    EXPECT_TRUE(last.empty());
    EXPECT_EQ(last.columns, (std::vector<std::string>{"id", "note"}));

    source.Close();
    EXPECT_FALSE(source.is_open());
    EXPECT_EQ(pq.statements()[2], "FETCH FORWARD 2 FROM xfer_pipe_cursor");
    EXPECT_EQ(pq.statements()[pq.statements().size() - 2], "CLOSE xfer_pipe_cursor");
    EXPECT_EQ(pq.statements().back(), "COMMIT");
    EXPECT_EQ(pq.live_results(), 0);
}

TEST(PostgresQuerySourceTest, FailedDeclareRollsBack) {
    SimulatedLibPq pq;
    pq.fail_statement("DECLARE", "relation \"missing\" does not exist");
    PostgresQuerySource source(TestConfig(), pq);

    try {
        source.Open("SELECT * FROM missing");
        FAIL() << "expected ScanError";
    } catch (const ScanError& e) {
        EXPECT_EQ(e.code(), ErrorCode::QueryFailed);
        EXPECT_THAT(e.what(), ::testing::HasSubstr("does not exist"));
    }
    EXPECT_FALSE(source.is_open());
    EXPECT_EQ(pq.statements().back(), "ROLLBACK");
}

TEST(PostgresQuerySourceTest, FailedFetchRollsBackOnClose) {
    SimulatedLibPq pq;
    pq.set_columns({"id"});
    PostgresQuerySource source(TestConfig(), pq);
    source.Open("SELECT id FROM orders");

    pq.fail_statement("FETCH");
    EXPECT_THROW(source.FetchBatch(10), ScanError);

    source.Close();
    EXPECT_EQ(pq.statements().back(), "ROLLBACK");
    for (const auto& sql : pq.statements()) {
        EXPECT_NE(sql, "COMMIT");
    }
}

TEST(PostgresQuerySourceTest, FetchWithoutOpenIsInvalidState) {
    SimulatedLibPq pq;
    PostgresQuerySource source(TestConfig(), pq);
    try {
        source.FetchBatch(10);
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidState);
    }
}

TEST(PostgresQuerySourceTest, DoubleOpenIsInvalidState) {
    SimulatedLibPq pq;
    PostgresQuerySource source(TestConfig(), pq);
    source.Open("SELECT 1");
    EXPECT_THROW(source.Open("SELECT 2"), SessionError);
}

TEST(PostgresQuerySourceTest, CloseWhenNotOpenIsNoop) {
    SimulatedLibPq pq;
    PostgresQuerySource source(TestConfig(), pq);
    EXPECT_NO_THROW(source.Close());
    EXPECT_TRUE(pq.statements().empty());
}

TEST(PostgresQuerySourceTest, DestructorClosesCursorAndDisconnects) {
    SimulatedLibPq pq;
    {
        PostgresQuerySource source(TestConfig(), pq);
        source.Open("SELECT 1");
    }
    EXPECT_EQ(pq.statements().back(), "COMMIT");
    EXPECT_EQ(pq.finish_calls(), 1);
}

TEST(PostgresQuerySourceTest, ConnectionFailureReported) {
    MockLibPq pq;
    auto* fake_conn = reinterpret_cast<PGconn*>(0x1234);
    char message[] = "connection refused";

    EXPECT_CALL(pq, connectdb(StrEq(TestConfig().connection_string()))).WillOnce(Return(fake_conn));
    EXPECT_CALL(pq, status(fake_conn)).WillOnce(Return(CONNECTION_BAD));
    EXPECT_CALL(pq, errorMessage(fake_conn)).WillOnce(Return(message));
    EXPECT_CALL(pq, finish(fake_conn)).Times(1);
    EXPECT_CALL(pq, exec(_, _)).Times(0);

    PostgresQuerySource source(TestConfig(), pq);
    try {
        source.Open("SELECT 1");
        FAIL() << "expected ScanError";
    } catch (const ScanError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConnectionFailed);
        EXPECT_THAT(e.what(), ::testing::HasSubstr("connection refused"));
    }
    EXPECT_FALSE(source.is_connected());
}

TEST(PostgresQuerySourceTest, NullResultReportsConnectionMessage) {
    MockLibPq pq;
    auto* fake_conn = reinterpret_cast<PGconn*>(0x1234);
    char message[] = "server closed the connection";

    EXPECT_CALL(pq, connectdb(_)).WillOnce(Return(fake_conn));
    EXPECT_CALL(pq, status(fake_conn)).WillOnce(Return(CONNECTION_OK));
    EXPECT_CALL(pq, exec(fake_conn, StrEq("BEGIN"))).WillOnce(Return(nullptr));
    EXPECT_CALL(pq, errorMessage(fake_conn)).WillOnce(Return(message));
    EXPECT_CALL(pq, finish(fake_conn)).Times(1);

    PostgresQuerySource source(TestConfig(), pq);
    EXPECT_THROW(source.Open("SELECT 1"), ScanError);
}
