// SPDX-License-Identifier: MIT

// src/transfer_operator.cpp
#include "xfer_pipe/transfer_operator.hpp"

#include <mutex>
#include <utility>

#include <fmt/format.h>

#include "xfer_pipe/error.hpp"
#include "xfer_pipe/logging.hpp"
#include "xfer_pipe/object_key.hpp"
#include "xfer_pipe/streaming_executor.hpp"

namespace xfer_pipe {

namespace {

std::string SourceSummary(const SourceConfig& source) {
    if (!source.sql.empty()) {
        return fmt::format("type: {} | sql: {} | rows_chunk: {}",
                           source.type, source.sql, source.rows_chunk);
    }
    return fmt::format("type: {} | path: {} | pattern: {} | recursive: {} | max_workers: {}",
                       source.type, source.path, source.EffectivePattern(),
                       source.recursive, source.max_workers);
}

std::string TargetSummary(const TargetConfig& target) {
    std::string out = fmt::format("type: {}", target.type);
    if (!target.key.empty()) out += fmt::format(" | key: {}", target.key);
    if (!target.prefix.empty()) out += fmt::format(" | prefix: {}", target.prefix);
    out += fmt::format(" | multi_file: {} | chunk_size: {}", target.multi_file,
                       FormatSize(target.chunk_size));
    if (target.compression) out += fmt::format(" | compression: zstd-{}", target.compression->level);
    return out;
}

std::string TargetLabel(const TargetConfig& target) {
    if (!target.key.empty()) return target.key;
    if (!target.prefix.empty()) return target.prefix;
    return "<per-item>";
}

void RequireDestination(const TransferResources& resources) {
    if (!resources.destination) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "Transfer requires a destination handle");
    }
}

}  // namespace

// SourceConfig / TargetConfig

std::string SourceConfig::EffectivePattern() const {
    if (!file_name.empty()) return fmt::format("^{}$", EscapeRegex(file_name));
    return pattern;
}

ScanOptions SourceConfig::ToScanOptions() const {
    ScanOptions options;
    options.root = path;
    options.pattern = EffectivePattern();
    options.recursive = recursive;
    options.check_is_modifying = check_is_modifying;
    options.stability_window = stability_window;
    options.predicate = predicate;
    return options;
}

std::string TargetConfig::KeyFor(const ItemInfo& item) const {
    if (!key.empty()) return key;
    if (key_for) return key_for(item);
    return JoinKey(prefix, item.name);
}

ChunkedBufferConfig TargetConfig::BufferConfig(std::string buffer_key,
                                               std::optional<uint64_t> total_size) const {
    ChunkedBufferConfig config;
    config.key = std::move(buffer_key);
    config.mode = mode();
    config.chunk_size = chunk_size;
    config.compression = compression;
    config.total_size = total_size;
    config.num_workers = upload_workers;
    config.oversize_policy = oversize_policy;
    config.retry = retry;
    return config;
}

spdlog::logger& RunContext::log() const {
    if (logger) return *logger;
    return *GetLogger();
}

// TransferOperator

TransferOutcome TransferOperator::Execute(const SourceConfig& source, const TargetConfig& target,
                                          const TransferResources& resources,
                                          const RunContext& context) {
    auto& log = context.log();
    log.info("OPERATOR | {} ({})", Name(), context.asset_name);
    log.info("SOURCE_CONFIG | {}", SourceSummary(source));
    log.info("TARGET_CONFIG | {}", TargetSummary(target));

    auto start = std::chrono::steady_clock::now();
    TransferOutcome outcome;
    try {
        Validate(source, target, resources);
        outcome = DoExecute(source, target, resources, context);
    } catch (const std::exception& e) {
        LogFailure(log, Name(), TargetLabel(target), e.what());
        throw;
    }
    double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    std::string line = "TRANSFER_STATS";
    if (outcome.stats.files_transferred) {
        line += fmt::format(" | files: {}", *outcome.stats.files_transferred);
    }
    if (outcome.stats.rows_processed) {
        line += fmt::format(" | rows: {}", *outcome.stats.rows_processed);
    }
    line += fmt::format(" | size: {} | duration: {:.2f}s | speed: {}",
                        FormatSize(outcome.stats.total_bytes), duration,
                        FormatThroughput(outcome.stats.total_bytes, duration));
    log.info("{}", line);
    return outcome;
}

void TransferOperator::Validate(const SourceConfig&, const TargetConfig& target,
                                const TransferResources& resources) const {
    RequireDestination(resources);
    if (target.chunk_size == 0 || target.upload_workers == 0) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "Target chunk size and upload workers must be positive");
    }
}

void TransferOperator::AbortBuffer(ChunkedTransferBuffer& buffer, const RunContext& context) {
    try {
        buffer.Abort();
    } catch (const SessionError& e) {
        LogFailure(context.log(), "abort", buffer.config().key, e.what());
    }
}

// FileTransferOperator

void FileTransferOperator::Validate(const SourceConfig& source, const TargetConfig& target,
                                    const TransferResources& resources) const {
    TransferOperator::Validate(source, target, resources);
    if (!resources.file_source) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "File transfer requires a file source handle");
    }
    if (source.path.empty()) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "File transfer requires a source path");
    }
    if (source.max_workers == 0) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "File transfer requires at least one worker");
    }
}

TransferOutcome FileTransferOperator::DoExecute(const SourceConfig& source,
                                                const TargetConfig& target,
                                                const TransferResources& resources,
                                                const RunContext& context) {
    FileSource& files = *resources.file_source;
    IDestination& destination = *resources.destination;
    auto& log = context.log();
    ScanOptions options = source.ToScanOptions();

    auto producer = [&](StreamProcessor<ItemInfo>& processor) {
        log.info("Scanning source path: {}", source.path);
        files.Scan(options, [&](const ItemInfo& item, size_t) {
            // A rejected Put() means a worker failed; stop discovering
            return processor.Put(item.name, item) ? ScanControl::Continue : ScanControl::Stop;
        });
    };

    auto worker = [&](StreamProcessor<ItemInfo>&, const WorkItem<ItemInfo>& work) {
        const ItemInfo& item = work.payload;
        std::string key = target.KeyFor(item);
        log.info("Transferring {} -> {}", item.key, key);

        std::optional<uint64_t> total;
        if (item.size > 0) total = item.size;
        ChunkedTransferBuffer buffer(destination, target.BufferConfig(key, total));
        try {
            files.Read(item, buffer);
            auto results = buffer.Close();
            for (auto& result : results) result.source = item.key;
            return results;
        } catch (const std::exception& e) {
            AbortBuffer(buffer, context);
            log.error("Transfer failed for {}: {}", item.name, e.what());
            throw;
        }
    };

    auto streamed = ExecuteStreaming<ItemInfo>(producer, worker, source.max_workers,
                                               fmt::format("{}:{}", Name(), source.path));

    TransferOutcome outcome;
    outcome.summary = streamed.summary;
    outcome.files = std::move(streamed.results);
    outcome.stats.files_transferred = outcome.summary.source_items;
    outcome.stats.total_bytes = outcome.summary.total_bytes;
    outcome.observations = {
        {"files_scanned", outcome.summary.source_items},
        {"files_uploaded", outcome.summary.source_items},
        {"bytes_transferred", outcome.summary.total_bytes},
    };
    return outcome;
}

// QueryTransferOperator

void QueryTransferOperator::Validate(const SourceConfig& source, const TargetConfig& target,
                                     const TransferResources& resources) const {
    TransferOperator::Validate(source, target, resources);
    if (!resources.query_source) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "Query transfer requires a query source handle");
    }
    if (source.sql.empty()) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "Query transfer requires a SQL statement");
    }
    if (source.rows_chunk == 0) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "rows_chunk must be positive");
    }
    if (target.key.empty()) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            "Query transfer requires a target key");
    }
}

TransferOutcome QueryTransferOperator::DoExecute(const SourceConfig& source,
                                                 const TargetConfig& target,
                                                 const TransferResources& resources,
                                                 const RunContext& context) {
    QuerySource& query = *resources.query_source;
    IDestination& destination = *resources.destination;
    auto& log = context.log();
    CsvEncoder encoder(source.csv);

    // Touched by the producer, then by the single worker, then by this
    // thread after the stream drains; never concurrently.
    std::optional<ChunkedTransferBuffer> buffer;
    uint64_t total_rows = 0;
    bool first_chunk = true;

    auto producer = [&](StreamProcessor<size_t>& processor) {
        log.info("Executing query and fetching in chunks of {}...", source.rows_chunk);
        query.Open(source.sql);
        buffer.emplace(destination, target.BufferConfig(target.key, std::nullopt));
        processor.Put("fetch[1]", 1);
    };

    auto worker = [&](StreamProcessor<size_t>& processor, const WorkItem<size_t>& work) {
        size_t index = work.payload;
        RowBatch batch = query.FetchBatch(source.rows_chunk);
        if (batch.empty()) {
            if (first_chunk && source.csv.include_header && !batch.columns.empty()) {
                buffer->Write(encoder.EncodeHeader(batch.columns));
            }
            return std::vector<TransferResult>{};
        }

        encoder.WriteBatch(*buffer, batch, first_chunk);
        total_rows += batch.rows.size();
        first_chunk = false;

        if (index % kProgressEvery == 0) {
            log.info("Database extraction progress: part {} processed | rows: {} | size: {}",
                     index, total_rows, FormatSize(buffer->bytes_written()));
        }
        processor.Put(fmt::format("fetch[{}]", index + 1), index + 1);
        return std::vector<TransferResult>{};
    };

    log.info("Using 1 worker for query transfer (one cursor per connection)");
    auto start = std::chrono::steady_clock::now();
    StreamingOutcome streamed;
    std::vector<TransferResult> files;
    try {
        streamed = ExecuteStreaming<size_t>(producer, worker, 1,
                                            fmt::format("{}:{}", Name(), target.key));
        query.Close();
        files = buffer->Close();
    } catch (const std::exception&) {
        if (buffer) AbortBuffer(*buffer, context);
        try {
            query.Close();
        } catch (const std::exception& close_error) {
            LogFailure(log, "close-cursor", target.key, close_error.what());
        }
        throw;
    }
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);

    TransferOutcome outcome;
    outcome.summary = SummarizeResults(files, streamed.summary.source_items, elapsed);
    outcome.files = std::move(files);
    outcome.stats.rows_processed = total_rows;
    outcome.stats.total_bytes = outcome.summary.total_bytes;
    outcome.stats.files_transferred = outcome.files.size();
    outcome.observations = {
        {"rows_extracted", total_rows},
        {"rows_written", total_rows},
    };
    return outcome;
}

}  // namespace xfer_pipe
