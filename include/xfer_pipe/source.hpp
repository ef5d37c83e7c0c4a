// SPDX-License-Identifier: MIT

// include/xfer_pipe/source.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "xfer_pipe/byte_sink.hpp"
#include "xfer_pipe/scan.hpp"

namespace xfer_pipe {

/// A scannable source whose items can be streamed out as bytes.
///
/// Read() may be called from several workers at once.
class FileSource : public SourceScanner {
public:
    /// Stream the bytes of `item` into `sink`, in order.
    /// @throws ScanError(SourceReadFailed) if the item cannot be read
    virtual void Read(const ItemInfo& item, IByteSink& sink) = 0;
};

/// Rows returned by one cursor fetch. A null column value is nullopt.
struct RowBatch {
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;

    bool empty() const { return rows.empty(); }
};

/// A relational source read through a forward-only cursor.
///
/// Not thread-safe: one cursor serves one worker.
class QuerySource {
public:
    virtual ~QuerySource() = default;

    /// Start the query and position the cursor before the first row.
    /// @throws ScanError(QueryFailed) or ScanError(ConnectionFailed)
    virtual void Open(const std::string& sql) = 0;

    /// Fetch up to `max_rows` rows. An empty batch means the cursor is
    /// exhausted; `columns` is filled even then.
    virtual RowBatch FetchBatch(size_t max_rows) = 0;

    /// Release the cursor. Safe to call when not open.
    virtual void Close() = 0;
};

}  // namespace xfer_pipe
