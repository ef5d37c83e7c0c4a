// SPDX-License-Identifier: MIT

// include/xfer_pipe/postgres_source.hpp
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "xfer_pipe/libpq_wrapper.hpp"
#include "xfer_pipe/source.hpp"

namespace xfer_pipe {

struct PostgresConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string database;
    std::string user;
    std::string password;

    /// libpq conninfo string; values with spaces or quotes are quoted.
    std::string connection_string() const;
};

// PostgresQuerySource - QuerySource over a server-side cursor.
//
// Open() connects on first use, begins a transaction and declares a
// NO SCROLL cursor for the query. FetchBatch() issues FETCH FORWARD n.
// Close() closes the cursor and commits, or rolls back after a failed
// fetch. Single-threaded.
class PostgresQuerySource : public QuerySource {
public:
    static constexpr std::string_view kCursorName = "xfer_pipe_cursor";

    explicit PostgresQuerySource(PostgresConfig config, ILibPq& pq = GetLibPq());
    ~PostgresQuerySource() override;

    PostgresQuerySource(const PostgresQuerySource&) = delete;
    PostgresQuerySource& operator=(const PostgresQuerySource&) = delete;

    /// @throws ScanError(ConnectionFailed) or ScanError(QueryFailed)
    void Open(const std::string& sql) override;

    /// @throws ScanError(QueryFailed); SessionError(InvalidState) if not open
    RowBatch FetchBatch(size_t max_rows) override;

    void Close() override;

    bool is_connected() const { return conn_ != nullptr; }
    bool is_open() const { return cursor_open_; }

private:
    void Connect();
    void Disconnect();

    PostgresConfig config_;
    ILibPq& pq_;
    PGconn* conn_ = nullptr;
    bool cursor_open_ = false;
    bool failed_ = false;
    std::vector<std::string> columns_;
};

}  // namespace xfer_pipe
