#pragma once
// =============================================================================
// IngestionCoordinator -- wires watcher, ledger, parser, sanitizer and writer
//
// Per file: claim in the ledger -> (watch only) settle delay -> lease a store
// connection -> read + sanitize lines -> parse -> batch write -> record.
//
// Claims follow one rule on every entry point:
//   success                    -> ledger record with the committed count
//   failure, nothing committed -> claim released, file may be retried
//   failure after commits      -> nothing recorded; the in-memory claim is
//                                 kept until restart
//
// Watch-triggered work runs on a bounded worker pool; failures are logged.
// Manual single-file processing and directory import return their results.
// stop() cancels every in-flight run at its next suspension point.
// =============================================================================

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "directory_watcher.hpp"
#include "ingest_result.hpp"
#include "line_parser.hpp"
#include "processed_ledger.hpp"
#include "../config.hpp"
#include "../store/connection_pool.hpp"
#include "../utils/cancellation.hpp"
#include "../utils/worker_pool.hpp"

namespace credingest {

// Process-wide state shared by the coordinator and every worker task.
// Built once in main() and torn down after the coordinator.
struct IngestContext {
    IngestContext(IngestConfig cfg, ConnectionPool& pool_ref, ProcessedLedger& ledger_ref)
        : config(std::move(cfg)), pool(pool_ref), ledger(ledger_ref),
          parser(config.known_schemes, config.app_schemes) {}

    IngestConfig config;
    ConnectionPool& pool;
    ProcessedLedger& ledger;
    LineParser parser;
    CancellationSource cancel;
};

class IngestionCoordinator {
public:
    explicit IngestionCoordinator(IngestContext& ctx);
    ~IngestionCoordinator();

    IngestionCoordinator(const IngestionCoordinator&) = delete;
    IngestionCoordinator& operator=(const IngestionCoordinator&) = delete;

    // Start watching `dir` (config data_dir if empty). DIRECTORY error on failure.
    bool start_watching(const std::string& dir = "", std::string* error = nullptr);

    // Cancel in-flight work, stop the watcher, join workers. Idempotent.
    void stop();

    // Fire-and-forget whole-directory import on the worker pool.
    // False if the coordinator is shutting down.
    bool trigger_directory_import(const std::string& dir);

    // Synchronous import of every candidate file in `dir`, bounded by the
    // import timeout. Per-file failures do not abort the remaining files.
    DirectoryImportResult import_directory(const std::string& dir);

    // Synchronous, ledger-checked, bounded by the per-file timeout
    FileResult process_single_file(const std::string& path);

    [[nodiscard]] WatcherStatus watcher_status() const;
    DuplicateReport list_duplicates(bool remove);
    ProcessedListing list_processed();
    IngestStats stats();

    // Block until every queued and running worker task has finished
    void wait_idle() { workers_.wait_idle(); }

    [[nodiscard]] bool is_watching() const;

private:
    void on_discovered(const std::string& path);
    void run_watched(const std::string& path);

    // Ingest a file whose name the caller has already claimed.
    // run_claimed() also turns an escaping exception into an IO result.
    FileResult run_claimed(const std::string& path, const CancellationToken& token);
    FileResult ingest_claimed(const std::string& path, const CancellationToken& token);
    void settle_claim(FileResult& result, CredentialStore* store);

    IngestContext& ctx_;
    WorkerPool workers_;

    mutable std::mutex watch_mutex_;
    std::unique_ptr<DirectoryWatcher> watcher_;
    bool stopped_ = false;
};

// Ledger key for a path: its final component
std::string ledger_key(const std::string& path);

} // namespace credingest
