// SPDX-License-Identifier: MIT

// src/libpq_wrapper.cpp
#include "xfer_pipe/libpq_wrapper.hpp"

namespace xfer_pipe {

namespace {

class RealLibPq final : public ILibPq {
public:
    PGconn* connectdb(const char* conninfo) override { return PQconnectdb(conninfo); }
    void finish(PGconn* conn) override { PQfinish(conn); }
    ConnStatusType status(const PGconn* conn) override { return PQstatus(conn); }
    char* errorMessage(const PGconn* conn) override { return PQerrorMessage(conn); }

    PGresult* exec(PGconn* conn, const char* query) override { return PQexec(conn, query); }

    ExecStatusType resultStatus(const PGresult* res) override { return PQresultStatus(res); }
    char* resultErrorMessage(const PGresult* res) override { return PQresultErrorMessage(res); }
    void clear(PGresult* res) override { PQclear(res); }
    int ntuples(const PGresult* res) override { return PQntuples(res); }
    int nfields(const PGresult* res) override { return PQnfields(res); }
    char* fname(const PGresult* res, int col) override { return PQfname(res, col); }
    char* getvalue(const PGresult* res, int row, int col) override {
        return PQgetvalue(res, row, col);
    }
    int getlength(const PGresult* res, int row, int col) override {
        return PQgetlength(res, row, col);
    }
    int getisnull(const PGresult* res, int row, int col) override {
        return PQgetisnull(res, row, col);
    }
};

}  // namespace

ILibPq& GetLibPq() {
    static RealLibPq instance;
    return instance;
}

}  // namespace xfer_pipe
