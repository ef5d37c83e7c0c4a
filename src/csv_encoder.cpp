// SPDX-License-Identifier: MIT

// src/csv_encoder.cpp
#include "xfer_pipe/csv_encoder.hpp"

namespace xfer_pipe {

std::string CsvEncoder::EncodeHeader(std::span<const std::string> columns) const {
    std::string out;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out += options_.delimiter;
        AppendField(out, columns[i]);
    }
    out += options_.line_terminator;
    return out;
}

std::string CsvEncoder::EncodeBatch(const RowBatch& batch, bool with_header) const {
    std::string out;
    if (with_header && options_.include_header) {
        out = EncodeHeader(batch.columns);
    }
    for (const auto& row : batch.rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out += options_.delimiter;
            AppendField(out, row[i]);
        }
        out += options_.line_terminator;
    }
    return out;
}

bool CsvEncoder::NeedsQuoting(const std::string& value) const {
    for (char c : value) {
        if (c == options_.delimiter || c == options_.quote_char || c == '\n' || c == '\r') {
            return true;
        }
    }
    return false;
}

void CsvEncoder::AppendField(std::string& out, const std::optional<std::string>& value) const {
    if (!value) return;

    switch (options_.quoting) {
        case CsvQuoting::None:
            for (char c : *value) {
                if (c == options_.delimiter || c == options_.escape_char ||
                    c == '\n' || c == '\r') {
                    out += options_.escape_char;
                }
                out += c;
            }
            return;
        case CsvQuoting::Minimal:
            if (!NeedsQuoting(*value)) {
                out += *value;
                return;
            }
            break;
        case CsvQuoting::All:
            break;
    }

    out += options_.quote_char;
    for (char c : *value) {
        if (c == options_.quote_char) out += options_.quote_char;
        out += c;
    }
    out += options_.quote_char;
}

}  // namespace xfer_pipe
