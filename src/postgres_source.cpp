// SPDX-License-Identifier: MIT

// src/postgres_source.cpp
#include "xfer_pipe/postgres_source.hpp"

#include <memory>
#include <sstream>

#include <fmt/format.h>

#include "xfer_pipe/error.hpp"
#include "xfer_pipe/logging.hpp"

namespace xfer_pipe {

namespace {

// Escape a connection string value (single quotes, backslashes).
std::string escape_conninfo_value(std::string_view val) {
    bool needs_quoting = val.empty();
    for (char c : val) {
        if (c == ' ' || c == '\'' || c == '\\' || c == '=') {
            needs_quoting = true;
            break;
        }
    }
    if (!needs_quoting) {
        return std::string(val);
    }

    std::string result;
    result.reserve(val.size() + 2);
    result += '\'';
    for (char c : val) {
        if (c == '\'' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    result += '\'';
    return result;
}

struct ResultDeleter {
    ILibPq* pq;
    void operator()(PGresult* res) const {
        if (res) pq->clear(res);
    }
};

using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

ResultPtr Exec(ILibPq& pq, PGconn* conn, const std::string& sql, ExecStatusType expected) {
    ResultPtr res(pq.exec(conn, sql.c_str()), ResultDeleter{&pq});
    if (!res) {
        throw ScanError(ErrorCode::QueryFailed,
            fmt::format("Query failed: {}", pq.errorMessage(conn)));
    }
    if (pq.resultStatus(res.get()) != expected) {
        throw ScanError(ErrorCode::QueryFailed,
            fmt::format("Query failed: {}", pq.resultErrorMessage(res.get())));
    }
    return res;
}

}  // namespace

std::string PostgresConfig::connection_string() const {
    std::ostringstream ss;
    ss << "host=" << escape_conninfo_value(host)
       << " port=" << port
       << " dbname=" << escape_conninfo_value(database)
       << " user=" << escape_conninfo_value(user)
       << " password=" << escape_conninfo_value(password);
    return ss.str();
}

PostgresQuerySource::PostgresQuerySource(PostgresConfig config, ILibPq& pq)
    : config_(std::move(config)), pq_(pq) {}

PostgresQuerySource::~PostgresQuerySource() {
    try {
        Close();
    } catch (const std::exception& e) {
        GetLogger()->warn("Closing cursor on {}/{} failed: {}", config_.host,
                          config_.database, e.what());
    }
    Disconnect();
}

void PostgresQuerySource::Connect() {
    if (conn_) return;
    PGconn* conn = pq_.connectdb(config_.connection_string().c_str());
    if (!conn || pq_.status(conn) != CONNECTION_OK) {
        std::string err = conn ? pq_.errorMessage(conn) : "connection allocation failed";
        if (conn) pq_.finish(conn);
        throw ScanError(ErrorCode::ConnectionFailed,
            fmt::format("Cannot connect to {}:{}/{}: {}", config_.host, config_.port,
                        config_.database, err));
    }
    conn_ = conn;
    GetLogger()->debug("Connected to {}:{}/{}", config_.host, config_.port, config_.database);
}

void PostgresQuerySource::Disconnect() {
    if (conn_) {
        pq_.finish(conn_);
        conn_ = nullptr;
    }
}

void PostgresQuerySource::Open(const std::string& sql) {
    if (cursor_open_) {
        throw SessionError(ErrorCode::InvalidState, "Cursor already open");
    }
    Connect();
    failed_ = false;
    columns_.clear();

    Exec(pq_, conn_, "BEGIN", PGRES_COMMAND_OK);
    try {
        Exec(pq_, conn_, fmt::format("DECLARE {} NO SCROLL CURSOR FOR {}", kCursorName, sql),
             PGRES_COMMAND_OK);
    } catch (const ScanError&) {
        Exec(pq_, conn_, "ROLLBACK", PGRES_COMMAND_OK);
        throw;
    }
    cursor_open_ = true;
}

RowBatch PostgresQuerySource::FetchBatch(size_t max_rows) {
    if (!cursor_open_) {
        throw SessionError(ErrorCode::InvalidState, "FetchBatch without an open cursor");
    }

    ResultPtr res;
    try {
        res = Exec(pq_, conn_, fmt::format("FETCH FORWARD {} FROM {}", max_rows, kCursorName),
                   PGRES_TUPLES_OK);
    } catch (const ScanError&) {
        failed_ = true;
        throw;
    }

    RowBatch batch;
    int nfields = pq_.nfields(res.get());
    if (columns_.empty()) {
        columns_.reserve(static_cast<size_t>(nfields));
        for (int col = 0; col < nfields; ++col) {
            columns_.emplace_back(pq_.fname(res.get(), col));
        }
    }
    batch.columns = columns_;

    int ntuples = pq_.ntuples(res.get());
    batch.rows.reserve(static_cast<size_t>(ntuples));
    for (int row = 0; row < ntuples; ++row) {
        std::vector<std::optional<std::string>> values;
        values.reserve(static_cast<size_t>(nfields));
        for (int col = 0; col < nfields; ++col) {
            if (pq_.getisnull(res.get(), row, col)) {
                values.emplace_back(std::nullopt);
            } else {
                values.emplace_back(std::string(pq_.getvalue(res.get(), row, col),
                                                static_cast<size_t>(pq_.getlength(res.get(), row, col))));
            }
        }
        batch.rows.push_back(std::move(values));
    }
    return batch;
}

void PostgresQuerySource::Close() {
    if (!cursor_open_) return;
    cursor_open_ = false;
    if (failed_) {
        Exec(pq_, conn_, "ROLLBACK", PGRES_COMMAND_OK);
        return;
    }
    Exec(pq_, conn_, fmt::format("CLOSE {}", kCursorName), PGRES_COMMAND_OK);
    Exec(pq_, conn_, "COMMIT", PGRES_COMMAND_OK);
}

}  // namespace xfer_pipe
