// SPDX-License-Identifier: MIT

// include/xfer_pipe/csv_encoder.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "xfer_pipe/byte_sink.hpp"
#include "xfer_pipe/source.hpp"

namespace xfer_pipe {

enum class CsvQuoting {
    Minimal,   ///< Quote fields containing the delimiter, quote char or a line break
    All,       ///< Quote every non-null field
    None,      ///< Never quote; escape special characters with escape_char
};

struct CsvOptions {
    char delimiter = ',';
    CsvQuoting quoting = CsvQuoting::Minimal;
    std::string line_terminator = "\n";
    char quote_char = '"';
    char escape_char = '\\';   ///< Used only with CsvQuoting::None
    bool include_header = true;
};

/// Encode query rows as CSV. A null value encodes as an empty field.
class CsvEncoder {
public:
    explicit CsvEncoder(CsvOptions options = {}) : options_(std::move(options)) {}

    /// Header line for `columns`, terminator included.
    std::string EncodeHeader(std::span<const std::string> columns) const;

    /// All rows of `batch`, each terminated. The header is prepended when
    /// `with_header` is set and the options include it.
    std::string EncodeBatch(const RowBatch& batch, bool with_header) const;

    /// EncodeBatch() straight into `sink`.
    template <ByteWriter Sink>
    void WriteBatch(Sink& sink, const RowBatch& batch, bool with_header) const {
        std::string text = EncodeBatch(batch, with_header);
        sink.Write(std::as_bytes(std::span<const char>(text.data(), text.size())));
    }

    const CsvOptions& options() const { return options_; }

private:
    void AppendField(std::string& out, const std::optional<std::string>& value) const;
    bool NeedsQuoting(const std::string& value) const;

    CsvOptions options_;
};

}  // namespace xfer_pipe
