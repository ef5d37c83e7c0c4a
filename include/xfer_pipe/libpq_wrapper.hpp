// SPDX-License-Identifier: MIT

// include/xfer_pipe/libpq_wrapper.hpp
#pragma once

#include <libpq-fe.h>

namespace xfer_pipe {

// ILibPq - the synchronous libpq calls PostgresQuerySource makes.
//
// Method names mirror the PQ* functions they stand for. Tests substitute a
// mock or a simulated cursor; production code uses GetLibPq().
class ILibPq {
public:
    virtual ~ILibPq() = default;

    virtual PGconn* connectdb(const char* conninfo) = 0;
    virtual void finish(PGconn* conn) = 0;
    virtual ConnStatusType status(const PGconn* conn) = 0;
    virtual char* errorMessage(const PGconn* conn) = 0;

    virtual PGresult* exec(PGconn* conn, const char* query) = 0;

    virtual ExecStatusType resultStatus(const PGresult* res) = 0;
    virtual char* resultErrorMessage(const PGresult* res) = 0;
    virtual void clear(PGresult* res) = 0;
    virtual int ntuples(const PGresult* res) = 0;
    virtual int nfields(const PGresult* res) = 0;
    virtual char* fname(const PGresult* res, int col) = 0;
    virtual char* getvalue(const PGresult* res, int row, int col) = 0;
    virtual int getlength(const PGresult* res, int row, int col) = 0;
    virtual int getisnull(const PGresult* res, int row, int col) = 0;
};

/// Process-wide ILibPq that forwards to the real libpq.
ILibPq& GetLibPq();

}  // namespace xfer_pipe
