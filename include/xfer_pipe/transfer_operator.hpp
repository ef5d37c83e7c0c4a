// SPDX-License-Identifier: MIT

// include/xfer_pipe/transfer_operator.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "xfer_pipe/chunked_transfer_buffer.hpp"
#include "xfer_pipe/csv_encoder.hpp"
#include "xfer_pipe/destination.hpp"
#include "xfer_pipe/source.hpp"
#include "xfer_pipe/transfer_stats.hpp"

namespace xfer_pipe {

/// Source half of a resolved transfer configuration.
struct SourceConfig {
    std::string type;                        ///< Registry type, e.g. "FILESYSTEM" or "POSTGRES"

    // File sources
    std::string path;                        ///< Root to scan
    std::string file_name;                   ///< Exact name; overrides pattern when set
    std::string pattern = ".*";              ///< Name regex, matched at the start
    bool recursive = false;
    bool check_is_modifying = false;
    std::chrono::seconds stability_window{60};
    std::function<bool(const ItemInfo&)> predicate;
    size_t max_workers = 5;                  ///< Items transferred in parallel

    // Query sources
    std::string sql;
    size_t rows_chunk = 10000;               ///< Rows per cursor fetch
    CsvOptions csv;

    /// Regex actually used for scanning: the escaped, anchored file_name
    /// if set, else pattern.
    std::string EffectivePattern() const;

    ScanOptions ToScanOptions() const;
};

/// Destination half of a resolved transfer configuration.
struct TargetConfig {
    std::string type = "OBJECT_STORE";
    std::string key;                                       ///< Explicit key; wins over the others
    std::string prefix;                                    ///< Used as prefix/name
    std::function<std::string(const ItemInfo&)> key_for;   ///< Per-item key
    bool multi_file = false;                               ///< MultiObjectSplit when set
    uint64_t chunk_size = 8 * 1024 * 1024;
    std::optional<CompressionSpec> compression;
    size_t upload_workers = 4;                             ///< Parallel uploads per buffer
    OversizeRecordPolicy oversize_policy = OversizeRecordPolicy::Fail;
    RetryConfig retry = RetryConfig::UploadDefaults();

    TransferMode mode() const {
        return multi_file ? TransferMode::MultiObjectSplit : TransferMode::SingleObjectMultipart;
    }

    /// Key for one source item: key, else key_for(item), else prefix/name.
    std::string KeyFor(const ItemInfo& item) const;

    ChunkedBufferConfig BufferConfig(std::string buffer_key,
                                     std::optional<uint64_t> total_size) const;
};

/// Already-connected source and destination handles for one run.
struct TransferResources {
    FileSource* file_source = nullptr;
    QuerySource* query_source = nullptr;
    IDestination* destination = nullptr;
};

/// Per-run context supplied by the host.
struct RunContext {
    std::string asset_name = "unknown_asset";
    std::shared_ptr<spdlog::logger> logger;   ///< Library logger when null

    spdlog::logger& log() const;
};

/// Counters reported to the host. Unset fields do not apply to the operator.
struct TransferStats {
    std::optional<uint64_t> files_transferred;
    std::optional<uint64_t> rows_processed;
    uint64_t total_bytes = 0;
};

struct TransferOutcome {
    TransferSummary summary;
    std::map<std::string, uint64_t> observations;
    TransferStats stats;
    std::vector<TransferResult> files;
};

// TransferOperator - one (source type, target type) transfer.
//
// Execute() logs the operator header and both configs, validates the
// inputs, runs DoExecute() and logs a TRANSFER_STATS line. Any failure is
// logged as operation/key/cause and rethrown unchanged.
class TransferOperator {
public:
    virtual ~TransferOperator() = default;

    TransferOutcome Execute(const SourceConfig& source, const TargetConfig& target,
                            const TransferResources& resources, const RunContext& context);

    virtual std::string_view Name() const = 0;

protected:
    /// @throws ConfigurationError(InvalidConfiguration)
    virtual void Validate(const SourceConfig& source, const TargetConfig& target,
                          const TransferResources& resources) const;

    virtual TransferOutcome DoExecute(const SourceConfig& source, const TargetConfig& target,
                                      const TransferResources& resources,
                                      const RunContext& context) = 0;

    /// Abort `buffer`, logging (not throwing) an abort failure so the
    /// original error stays the one reported.
    static void AbortBuffer(ChunkedTransferBuffer& buffer, const RunContext& context);
};

/// FileSource -> object store. One ChunkedTransferBuffer per item, items
/// transferred by SourceConfig::max_workers workers while scanning continues.
class FileTransferOperator : public TransferOperator {
public:
    std::string_view Name() const override { return "FileTransferOperator"; }

protected:
    void Validate(const SourceConfig& source, const TargetConfig& target,
                  const TransferResources& resources) const override;
    TransferOutcome DoExecute(const SourceConfig& source, const TargetConfig& target,
                              const TransferResources& resources,
                              const RunContext& context) override;
};

/// QuerySource -> one CSV object (or split CSV objects). A single worker
/// fetches rows_chunk rows at a time and queues the next fetch itself.
class QueryTransferOperator : public TransferOperator {
public:
    /// Fetches between progress log lines.
    static constexpr size_t kProgressEvery = 10;

    std::string_view Name() const override { return "QueryTransferOperator"; }

protected:
    void Validate(const SourceConfig& source, const TargetConfig& target,
                  const TransferResources& resources) const override;
    TransferOutcome DoExecute(const SourceConfig& source, const TargetConfig& target,
                              const TransferResources& resources,
                              const RunContext& context) override;
};

}  // namespace xfer_pipe
