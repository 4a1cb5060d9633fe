#include "ingestion_coordinator.hpp"
#include "batch_writer.hpp"
#include "duplicate_resolver.hpp"
#include "sanitizer.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

namespace credingest {
namespace fs = std::filesystem;

std::string ledger_key(const std::string& path) {
    return fs::path(path).filename().string();
}

IngestionCoordinator::IngestionCoordinator(IngestContext& ctx)
    : ctx_(ctx), workers_(ctx.config.worker_threads, ctx.config.queue_capacity) {}

IngestionCoordinator::~IngestionCoordinator() { stop(); }

bool IngestionCoordinator::start_watching(const std::string& dir, std::string* error) {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    if (stopped_) {
        if (error) *error = "coordinator is stopped";
        return false;
    }
    if (watcher_ && watcher_->is_running()) {
        if (error) *error = "already watching " + watcher_->directory();
        return false;
    }

    std::string target = dir.empty() ? ctx_.config.data_dir : dir;
    auto watcher = std::make_unique<DirectoryWatcher>(
        target, ctx_.config.file_suffix,
        [this](const std::string& path) { on_discovered(path); });

    if (!watcher->start(error)) return false;
    watcher_ = std::move(watcher);
    LOG_INF("[coordinator] Watcher started on %s", target.c_str());
    return true;
}

void IngestionCoordinator::stop() {
    // Signal first: in-flight runs and settle waits end without the lock
    ctx_.cancel.cancel();

    std::unique_ptr<DirectoryWatcher> watcher;
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        if (stopped_) return;
        stopped_ = true;
        watcher = std::move(watcher_);
    }

    // Workers first: a watcher blocked in submit() is released by shutdown
    workers_.shutdown();
    if (watcher) watcher->stop();
    LOG_INF("[coordinator] Stopped");
}

bool IngestionCoordinator::is_watching() const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return watcher_ && watcher_->is_running();
}

// --- Watch path ---

void IngestionCoordinator::on_discovered(const std::string& path) {
    std::string name = ledger_key(path);
    if (!ctx_.ledger.try_claim(name)) {
        LOG_DBG("[coordinator] Skipping already processed file: %s", name.c_str());
        return;
    }
    if (!workers_.submit([this, path] { run_watched(path); })) {
        ctx_.ledger.release(name);
        LOG_WRN("[coordinator] Shutting down -- not queueing %s", name.c_str());
    }
}

void IngestionCoordinator::run_watched(const std::string& path) {
    CancellationToken base = ctx_.cancel.token();

    // Best-effort wait for the writer of a freshly created file to finish
    if (!base.wait_for(std::chrono::milliseconds(ctx_.config.settle_delay_ms))) {
        ctx_.ledger.release(ledger_key(path));
        LOG_DBG("[coordinator] Cancelled before processing %s", path.c_str());
        return;
    }

    FileResult r = run_claimed(
        path, base.with_timeout(std::chrono::seconds(ctx_.config.file_timeout_sec)));
    if (!r.ok()) {
        LOG_ERR("[coordinator] Failed to process %s: [%s] %s",
            path.c_str(), error_kind_str(r.error_kind), r.error.c_str());
    }
}

// --- Core per-file run ---

FileResult IngestionCoordinator::run_claimed(const std::string& path,
                                             const CancellationToken& token) {
    try {
        return ingest_claimed(path, token);
    } catch (const std::exception& e) {
        // The read/write loop catches its own exceptions, so nothing was
        // committed when one gets here
        ctx_.ledger.release(ledger_key(path));
        LOG_ERR("[coordinator] Processing %s threw: %s", path.c_str(), e.what());
        FileResult result;
        result.filename = ledger_key(path);
        result.error_kind = ErrorKind::IO;
        result.error = std::string("processing failed: ") + e.what();
        return result;
    }
}

FileResult IngestionCoordinator::ingest_claimed(const std::string& path,
                                                const CancellationToken& token) {
    Timer timer;
    FileResult result;
    result.filename = ledger_key(path);

    auto finish = [&](CredentialStore* store) {
        result.duration_ms = timer.elapsed_ms();
        settle_claim(result, store);
        return result;
    };

    if (token.stop_requested()) {
        result.error_kind = ErrorKind::TIMEOUT;
        result.error = token.is_cancelled() ? "ingestion cancelled" : "ingestion timed out";
        return finish(nullptr);
    }

    Lease lease = ctx_.pool.acquire(token);
    if (!lease) {
        if (token.stop_requested()) {
            result.error_kind = ErrorKind::TIMEOUT;
            result.error = "timed out waiting for a store connection";
        } else {
            result.error_kind = ErrorKind::STORE;
            result.error = "could not acquire a store connection";
        }
        return finish(nullptr);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        result.error_kind = ErrorKind::IO;
        result.error = "cannot open " + path;
        return finish(&*lease);
    }

    LOG_INF("[coordinator] Processing file: %s", result.filename.c_str());

    LineReader reader(in);
    BatchWriter writer(*lease, local_date_string(), ctx_.config.batch_size, token);

    std::string line;
    uint64_t unparsed = 0;
    std::string aborted;
    try {
        while (reader.next(line)) {
            auto parsed = ctx_.parser.parse(line);
            if (!parsed) {
                ++unparsed;
                continue;
            }
            if (!writer.add(std::move(parsed->triple))) break;
        }
        if (!writer.failed()) writer.finish();
    } catch (const std::exception& e) {
        aborted = e.what();
        LOG_ERR("[coordinator] Processing %s aborted: %s", result.filename.c_str(), e.what());
    }

    result.entries_added = writer.committed();
    if (!aborted.empty()) {
        result.error_kind = ErrorKind::IO;
        result.error = "processing aborted: " + aborted;
    } else if (writer.failed()) {
        result.error_kind = writer.error_kind();
        result.error = writer.error();
    } else if (reader.failed()) {
        result.error_kind = ErrorKind::IO;
        result.error = "read error after " + std::to_string(reader.lines_read()) + " lines";
    }

    LOG_DBG("[coordinator] %s: %llu lines read, %llu skipped",
        result.filename.c_str(),
        static_cast<unsigned long long>(reader.lines_read()),
        static_cast<unsigned long long>(unparsed));

    return finish(&*lease);
}

void IngestionCoordinator::settle_claim(FileResult& result, CredentialStore* store) {
    const std::string& name = result.filename;

    if (!result.ok()) {
        // A failed attempt is never written to the persistent ledger
        if (result.entries_added == 0) {
            ctx_.ledger.release(name);
        } else {
            // Earlier batches are committed: keep the in-memory claim so this
            // session does not insert them again. A restart retries the file.
            LOG_WRN("[coordinator] %s stopped after %lld committed entries -- not recorded",
                name.c_str(), static_cast<long long>(result.entries_added));
        }
        return;
    }

    if (!store || !ctx_.ledger.record(*store, name, result.entries_added)) {
        result.error_kind = ErrorKind::STORE;
        result.error = "failed to record processed file";
        LOG_ERR("[coordinator] Ledger record for %s not written (%lld entries committed)",
            name.c_str(), static_cast<long long>(result.entries_added));
        return;
    }

    LOG_INF("[coordinator] Finished processing %s: %lld entries added (%lld ms)",
        name.c_str(), static_cast<long long>(result.entries_added),
        static_cast<long long>(result.duration_ms));
}

// --- Manual entry points ---

FileResult IngestionCoordinator::process_single_file(const std::string& path) {
    FileResult result;
    result.filename = ledger_key(path);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        result.error_kind = ErrorKind::IO;
        result.error = "file not found: " + path;
        return result;
    }

    CancellationToken token =
        ctx_.cancel.token().with_timeout(std::chrono::seconds(ctx_.config.file_timeout_sec));

    if (!ctx_.ledger.try_claim(result.filename)) {
        result.already_processed = true;
        Lease lease = ctx_.pool.acquire(token);
        if (!lease) {
            result.error_kind = ErrorKind::STORE;
            result.error = "could not acquire a store connection";
            return result;
        }
        bool ok = true;
        auto recorded = ctx_.ledger.recorded_count(*lease, result.filename, ok);
        if (!ok) {
            result.error_kind = ErrorKind::STORE;
            result.error = "failed to look up processed file";
            return result;
        }
        // No row yet: another run holds the claim and has not finished
        result.entries_added = recorded.value_or(0);
        LOG_INF("[coordinator] File already processed: %s (%lld entries)",
            result.filename.c_str(), static_cast<long long>(result.entries_added));
        return result;
    }

    return run_claimed(path, token);
}

DirectoryImportResult IngestionCoordinator::import_directory(const std::string& dir) {
    Timer timer;
    DirectoryImportResult result;
    result.directory = dir;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        result.error_kind = ErrorKind::DIRECTORY;
        result.error = "directory not found: " + dir;
        LOG_ERR("[coordinator] %s", result.error.c_str());
        return result;
    }

    auto files = DirectoryWatcher::list_candidates(dir, ctx_.config.file_suffix);
    result.files_found = static_cast<int64_t>(files.size());
    if (files.empty()) {
        result.error_kind = ErrorKind::IO;
        result.error = "no files found";
        LOG_WRN("[coordinator] No *%s files in %s", ctx_.config.file_suffix.c_str(), dir.c_str());
        return result;
    }

    CancellationToken token =
        ctx_.cancel.token().with_timeout(std::chrono::seconds(ctx_.config.import_timeout_sec));

    LOG_INF("[coordinator] Importing %zu files from %s", files.size(), dir.c_str());

    for (const auto& path : files) {
        if (token.stop_requested()) {
            result.error_kind = ErrorKind::TIMEOUT;
            result.error = token.is_cancelled() ? "import cancelled" : "import timed out";
            LOG_ERR("[coordinator] %s after %lld files", result.error.c_str(),
                static_cast<long long>(result.files_processed + result.files_failed));
            break;
        }

        std::string name = ledger_key(path);
        if (!ctx_.ledger.try_claim(name)) {
            ++result.files_skipped;
            continue;
        }

        FileResult fr = run_claimed(path, token);
        result.entries_added += fr.entries_added;
        if (fr.ok()) {
            ++result.files_processed;
        } else {
            ++result.files_failed;
            LOG_ERR("[coordinator] Error processing file %s: [%s] %s",
                name.c_str(), error_kind_str(fr.error_kind), fr.error.c_str());
        }
        result.files.push_back(std::move(fr));
    }

    LOG_INF("[coordinator] Import of %s done: %lld processed, %lld skipped, %lld failed, "
            "%lld entries (%.1fs)",
        dir.c_str(),
        static_cast<long long>(result.files_processed),
        static_cast<long long>(result.files_skipped),
        static_cast<long long>(result.files_failed),
        static_cast<long long>(result.entries_added),
        timer.elapsed_sec());
    return result;
}

bool IngestionCoordinator::trigger_directory_import(const std::string& dir) {
    return workers_.submit([this, dir] {
        DirectoryImportResult r = import_directory(dir);
        if (!r.ok()) {
            LOG_ERR("[coordinator] Directory import of %s failed: [%s] %s",
                dir.c_str(), error_kind_str(r.error_kind), r.error.c_str());
        }
    });
}

// --- Queries ---

WatcherStatus IngestionCoordinator::watcher_status() const {
    WatcherStatus status;
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        status.directory = watcher_ ? watcher_->directory() : ctx_.config.data_dir;
        status.watcher_active = watcher_ && watcher_->is_running();
    }
    status.files = DirectoryWatcher::list_candidates(status.directory, ctx_.config.file_suffix);
    status.processed_files = ctx_.ledger.snapshot();
    status.processed_count = static_cast<int64_t>(status.processed_files.size());
    return status;
}

DuplicateReport IngestionCoordinator::list_duplicates(bool remove) {
    Lease lease = ctx_.pool.acquire(ctx_.cancel.token());
    if (!lease) {
        DuplicateReport report;
        report.remove_requested = remove;
        report.error_kind = ErrorKind::STORE;
        report.error = "could not acquire a store connection";
        return report;
    }
    DuplicateResolver resolver(*lease);
    return resolver.resolve(remove);
}

ProcessedListing IngestionCoordinator::list_processed() {
    ProcessedListing listing;
    Lease lease = ctx_.pool.acquire(ctx_.cancel.token());
    if (!lease) {
        listing.error_kind = ErrorKind::STORE;
        listing.error = "could not acquire a store connection";
        return listing;
    }
    if (!lease->list_processed(listing.records)) {
        listing.records.clear();
        listing.error_kind = ErrorKind::STORE;
        listing.error = "failed to query processed files";
    }
    return listing;
}

IngestStats IngestionCoordinator::stats() {
    IngestStats s;
    Lease lease = ctx_.pool.acquire(ctx_.cancel.token());
    if (!lease) {
        s.error_kind = ErrorKind::STORE;
        s.error = "could not acquire a store connection";
        return s;
    }
    std::vector<ProcessedFileRecord> records;
    if (!lease->total_entries_added(s.total_records) ||
        !lease->count_entries(s.stored_entries) ||
        !lease->list_processed(records)) {
        s.error_kind = ErrorKind::STORE;
        s.error = "failed to count entries";
        return s;
    }
    s.processed_files = static_cast<int64_t>(records.size());
    return s;
}

} // namespace credingest
