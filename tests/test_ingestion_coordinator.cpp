// =============================================================================
// IngestionCoordinator Tests -- full pipeline against the in-memory store
// =============================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <stdexcept>
#include <thread>

#include <unistd.h>

#include "ingest/ingestion_coordinator.hpp"
#include "memory_store.hpp"
#include "utils/timer.hpp"

using namespace credingest;
using namespace credingest::testing_support;
namespace fs = std::filesystem;

class IngestionCoordinatorTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryDatabase> db = std::make_shared<MemoryDatabase>();
    fs::path dir;
    IngestConfig cfg;

    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<ProcessedLedger> ledger;
    std::unique_ptr<IngestContext> ctx;
    std::unique_ptr<IngestionCoordinator> coord;

    void SetUp() override {
        std::random_device rd;
        dir = fs::temp_directory_path() /
              ("credingest_coord_" + std::to_string(::getpid()) + "_" + std::to_string(rd()));
        fs::create_directories(dir);

        cfg.data_dir = dir.string();
        cfg.settle_delay_ms = 10;
        cfg.pool_size = 2;
        cfg.worker_threads = 2;
    }

    void TearDown() override {
        coord.reset();
        ctx.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    // Build the pipeline; call after adjusting cfg and seeding db
    void start() {
        pool = std::make_unique<ConnectionPool>(memory_factory(db), cfg.store, cfg.pool_size);
        ASSERT_TRUE(pool->open());
        ledger = std::make_unique<ProcessedLedger>();
        {
            Lease lease = pool->acquire();
            ASSERT_TRUE(ledger->load(*lease));
        }
        ctx = std::make_unique<IngestContext>(cfg, *pool, *ledger);
        coord = std::make_unique<IngestionCoordinator>(*ctx);
    }

    fs::path write_dump(const std::string& name, int valid_lines, const std::string& extra = "") {
        fs::path p = dir / name;
        std::ofstream out(p, std::ios::binary);
        for (int i = 0; i < valid_lines; ++i) {
            out << "https://" << name << "-site" << i << ".com/login:user" << i << ":pw" << i << "\n";
        }
        out << extra;
        return p;
    }

    bool wait_until(const std::function<bool()>& pred,
                    std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto until = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < until) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return pred();
    }
};

// --- Directory import ---

TEST_F(IngestionCoordinatorTest, ImportSkipsFilesAlreadyInLedger) {
    write_dump("A.txt", 500);
    write_dump("B.txt", 500);
    db->processed["B.txt"] = {1, 500};
    start();

    auto result = coord->import_directory(dir.string());
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.files_found, 2);
    EXPECT_EQ(result.files_skipped, 1);
    EXPECT_EQ(result.files_processed, 1);
    EXPECT_EQ(result.files_failed, 0);
    EXPECT_EQ(result.entries_added, 500);

    EXPECT_EQ(db->entry_count(), 500u);
    EXPECT_EQ(db->processed_count("A.txt").value_or(-1), 500);
    EXPECT_EQ(db->processed_count("B.txt").value_or(-1), 500);
    EXPECT_EQ(db->upsert_calls, 1);
}

TEST_F(IngestionCoordinatorTest, ImportEmptyDirectoryIsAnError) {
    start();
    auto result = coord->import_directory(dir.string());
    EXPECT_EQ(result.error_kind, ErrorKind::IO);
    EXPECT_EQ(result.error, "no files found");
}

TEST_F(IngestionCoordinatorTest, ImportMissingDirectory) {
    start();
    auto result = coord->import_directory((dir / "nope").string());
    EXPECT_EQ(result.error_kind, ErrorKind::DIRECTORY);
}

TEST_F(IngestionCoordinatorTest, ImportContinuesPastFailingFile) {
    write_dump("1.txt", 3);
    write_dump("2.txt", 3);
    write_dump("3.txt", 3);
    db->fail_insert_call = 2;   // files are processed in name order
    start();

    auto result = coord->import_directory(dir.string());
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.files_processed, 2);
    EXPECT_EQ(result.files_failed, 1);
    EXPECT_EQ(result.entries_added, 6);
    ASSERT_EQ(result.files.size(), 3u);
    EXPECT_EQ(result.files[1].filename, "2.txt");
    EXPECT_EQ(result.files[1].error_kind, ErrorKind::STORE);

    // Nothing committed for 2.txt: not recorded, free to retry
    EXPECT_FALSE(db->processed_count("2.txt").has_value());
    EXPECT_FALSE(ledger->is_known("2.txt"));

    auto retry = coord->import_directory(dir.string());
    EXPECT_EQ(retry.files_skipped, 2);
    EXPECT_EQ(retry.files_processed, 1);
    EXPECT_EQ(db->entry_count(), 9u);
}

TEST_F(IngestionCoordinatorTest, TriggeredImportRunsInBackground) {
    write_dump("bg.txt", 20);
    start();
    ASSERT_TRUE(coord->trigger_directory_import(dir.string()));
    coord->wait_idle();
    EXPECT_EQ(db->entry_count(), 20u);
    EXPECT_EQ(db->processed_count("bg.txt").value_or(-1), 20);
}

// --- Single file ---

TEST_F(IngestionCoordinatorTest, SingleFileIsIdempotent) {
    auto path = write_dump("one.txt", 3);
    start();

    auto first = coord->process_single_file(path.string());
    ASSERT_TRUE(first.ok()) << first.error;
    EXPECT_EQ(first.entries_added, 3);
    EXPECT_FALSE(first.already_processed);

    auto second = coord->process_single_file(path.string());
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(second.already_processed);
    EXPECT_EQ(second.entries_added, 3);
    EXPECT_EQ(db->entry_count(), 3u);
}

TEST_F(IngestionCoordinatorTest, SingleFileMissing) {
    start();
    auto r = coord->process_single_file((dir / "ghost.txt").string());
    EXPECT_EQ(r.error_kind, ErrorKind::IO);
    EXPECT_FALSE(ledger->is_known("ghost.txt"));
}

TEST_F(IngestionCoordinatorTest, SkipsUnparseableAndBlankLines) {
    std::string junk = "\n   \njustgarbage\n";
    junk += std::string("\0\0\0", 3) + "http://a.b:u:p\r\n";
    junk += "\xFF\xFE\n";
    auto path = write_dump("mixed.txt", 2, junk);
    start();

    auto r = coord->process_single_file(path.string());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.entries_added, 3);

    auto rows = db->snapshot_entries();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[2].url, "http://a.b");
    EXPECT_EQ(rows[2].password, "p");
}

TEST_F(IngestionCoordinatorTest, StampsTodayOnEveryRow) {
    auto path = write_dump("dated.txt", 5);
    cfg.batch_size = 2;
    start();

    ASSERT_TRUE(coord->process_single_file(path.string()).ok());
    std::string today = local_date_string();
    for (const auto& e : db->snapshot_entries()) EXPECT_EQ(e.ingested_on, today);
}

TEST_F(IngestionCoordinatorTest, FailureWithNothingCommittedReleasesClaim) {
    auto path = write_dump("retry.txt", 4);
    db->fail_insert_call = 1;
    start();

    auto r = coord->process_single_file(path.string());
    EXPECT_EQ(r.error_kind, ErrorKind::STORE);
    EXPECT_EQ(r.entries_added, 0);
    EXPECT_FALSE(ledger->is_known("retry.txt"));
    EXPECT_EQ(db->processed_rows(), 0u);

    auto again = coord->process_single_file(path.string());
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.entries_added, 4);
}

TEST_F(IngestionCoordinatorTest, PartialFailureIsNotRecorded) {
    auto path = write_dump("partial.txt", 5);
    cfg.batch_size = 2;
    db->fail_insert_call = 2;
    start();

    auto r = coord->process_single_file(path.string());
    EXPECT_EQ(r.error_kind, ErrorKind::STORE);
    EXPECT_EQ(r.entries_added, 2);
    EXPECT_EQ(db->entry_count(), 2u);

    // Claimed for this session, absent from the persistent ledger
    EXPECT_TRUE(ledger->is_known("partial.txt"));
    EXPECT_FALSE(db->processed_count("partial.txt").has_value());
    EXPECT_EQ(db->upsert_calls, 0);

    auto again = coord->process_single_file(path.string());
    EXPECT_TRUE(again.already_processed);
    EXPECT_EQ(db->entry_count(), 2u);
}

TEST_F(IngestionCoordinatorTest, CancellationMidFileKeepsFlushedBatchesUnrecorded) {
    auto path = write_dump("cancel.txt", 6);
    cfg.batch_size = 2;
    start();
    db->after_insert = [this] { ctx->cancel.cancel(); };

    auto r = coord->process_single_file(path.string());
    EXPECT_EQ(r.error_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(r.entries_added, 2);
    EXPECT_EQ(db->entry_count(), 2u);
    EXPECT_FALSE(db->processed_count("cancel.txt").has_value());
    EXPECT_EQ(db->processed_rows(), 0u);
}

TEST_F(IngestionCoordinatorTest, ExceptionAfterCommitKeepsClaim) {
    auto path = write_dump("throws.txt", 6);
    cfg.batch_size = 2;
    start();
    int calls = 0;
    db->after_insert = [&calls] {
        if (++calls == 2) throw std::runtime_error("disk on fire");
    };

    auto r = coord->process_single_file(path.string());
    EXPECT_EQ(r.error_kind, ErrorKind::IO);
    EXPECT_NE(r.error.find("disk on fire"), std::string::npos);
    EXPECT_EQ(r.entries_added, 2);
    EXPECT_TRUE(ledger->is_known("throws.txt"));
    EXPECT_FALSE(db->processed_count("throws.txt").has_value());

    size_t rows = db->entry_count();
    auto again = coord->process_single_file(path.string());
    EXPECT_TRUE(again.already_processed);
    EXPECT_EQ(db->entry_count(), rows);
}

TEST_F(IngestionCoordinatorTest, ExceptionBeforeCommitReleasesClaim) {
    write_dump("boom.txt", 3);
    start();
    bool armed = true;
    db->after_insert = [&armed] {
        if (armed) {
            armed = false;
            throw std::runtime_error("boom");
        }
    };

    // The throwing insert is not counted as committed
    auto result = coord->import_directory(dir.string());
    EXPECT_EQ(result.files_failed, 1);
    ASSERT_EQ(result.files.size(), 1u);
    EXPECT_EQ(result.files[0].error_kind, ErrorKind::IO);
    EXPECT_EQ(result.files[0].entries_added, 0);
    EXPECT_FALSE(ledger->is_known("boom.txt"));

    auto retry = coord->import_directory(dir.string());
    EXPECT_EQ(retry.files_processed, 1);
    EXPECT_EQ(db->processed_count("boom.txt").value_or(-1), 3);
}

TEST_F(IngestionCoordinatorTest, StoppedCoordinatorRejectsWork) {
    auto path = write_dump("late.txt", 1);
    start();
    coord->stop();

    auto r = coord->process_single_file(path.string());
    EXPECT_EQ(r.error_kind, ErrorKind::TIMEOUT);
    EXPECT_FALSE(ledger->is_known("late.txt"));
    EXPECT_FALSE(coord->trigger_directory_import(dir.string()));
}

TEST_F(IngestionCoordinatorTest, LedgerWriteFailureIsReported) {
    auto path = write_dump("noledger.txt", 2);
    start();
    db->fail_upsert = true;

    auto r = coord->process_single_file(path.string());
    EXPECT_EQ(r.error_kind, ErrorKind::STORE);
    EXPECT_EQ(r.entries_added, 2);
    // Rows landed, so the name stays claimed for this session
    EXPECT_TRUE(ledger->is_known("noledger.txt"));
}

// --- Watching ---

TEST_F(IngestionCoordinatorTest, WatchIngestsExistingAndNewFiles) {
    write_dump("early.txt", 4);
    start();

    std::string error;
    ASSERT_TRUE(coord->start_watching(dir.string(), &error)) << error;
    EXPECT_TRUE(coord->is_watching());

    ASSERT_TRUE(wait_until([&] { return db->processed_count("early.txt").has_value(); }));

    // Write elsewhere and move in, so the file is complete when it appears
    auto staged = write_dump("late.txt.part", 7);
    fs::rename(staged, dir / "late.txt");
    ASSERT_TRUE(wait_until([&] { return db->processed_count("late.txt").has_value(); }));
    EXPECT_EQ(db->processed_count("late.txt").value_or(-1), 7);

    auto status = coord->watcher_status();
    EXPECT_TRUE(status.watcher_active);
    EXPECT_EQ(status.directory, dir.string());
    EXPECT_EQ(status.files.size(), 2u);
    EXPECT_EQ(status.processed_count, 2);

    coord->stop();
    EXPECT_FALSE(coord->is_watching());
    EXPECT_EQ(db->entry_count(), 11u);
}

TEST_F(IngestionCoordinatorTest, SettleDelayPrecedesReading) {
    cfg.settle_delay_ms = 800;
    start();
    ASSERT_TRUE(coord->start_watching());

    auto staged = write_dump("slow.txt.part", 3);
    Timer timer;
    fs::rename(staged, dir / "slow.txt");
    ASSERT_TRUE(wait_until([&] { return ledger->is_known("slow.txt"); }));

    // The writer is still appending while the file settles
    {
        std::ofstream out(dir / "slow.txt", std::ios::binary | std::ios::app);
        out << "https://late.com/login:late1:pw1\nhttps://late.com/login:late2:pw2\n";
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(db->entry_count(), 0u);

    ASSERT_TRUE(wait_until([&] { return db->processed_count("slow.txt").has_value(); }));
    EXPECT_GE(timer.elapsed_ms(), 800);
    EXPECT_EQ(db->processed_count("slow.txt").value_or(-1), 5);
}

TEST_F(IngestionCoordinatorTest, StopDuringStartupScanIsPrompt) {
    for (int i = 0; i < 8; ++i) write_dump("f" + std::to_string(i) + ".txt", 5);
    cfg.worker_threads = 1;
    cfg.queue_capacity = 1;
    cfg.settle_delay_ms = 1000;
    start();

    Timer start_timer;
    ASSERT_TRUE(coord->start_watching());
    EXPECT_LT(start_timer.elapsed_ms(), 500);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    Timer stop_timer;
    coord->stop();
    EXPECT_LT(stop_timer.elapsed_ms(), 1000);
    EXPECT_FALSE(coord->is_watching());

    EXPECT_EQ(db->entry_count(), 0u);
    EXPECT_EQ(db->processed_rows(), 0u);
}

TEST_F(IngestionCoordinatorTest, WatchSkipsLedgerFiles) {
    write_dump("known.txt", 3);
    db->processed["known.txt"] = {1, 3};
    start();

    ASSERT_TRUE(coord->start_watching());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    coord->wait_idle();
    EXPECT_EQ(db->entry_count(), 0u);
}

TEST_F(IngestionCoordinatorTest, WatchStartFailure) {
    auto blocker = write_dump("blocker", 0);
    start();
    std::string error;
    EXPECT_FALSE(coord->start_watching((blocker / "sub").string(), &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(coord->is_watching());
}

// --- Queries ---

TEST_F(IngestionCoordinatorTest, DuplicatesProcessedAndStats) {
    auto a = dir / "dup1.txt";
    auto b = dir / "dup2.txt";
    { std::ofstream(a) << "https://x.com:bob:pw\nhttps://y.com:amy:pw\n"; }
    { std::ofstream(b) << "https://x.com:bob:pw\n"; }
    start();

    ASSERT_TRUE(coord->process_single_file(a.string()).ok());
    ASSERT_TRUE(coord->process_single_file(b.string()).ok());

    auto listing = coord->list_processed();
    ASSERT_TRUE(listing.ok());
    ASSERT_EQ(listing.records.size(), 2u);
    EXPECT_EQ(listing.records[0].filename, "dup2.txt");   // newest first

    auto report = coord->list_duplicates(false);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.found, 1);
    EXPECT_EQ(report.rows[0].id, 3);

    auto removed = coord->list_duplicates(true);
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(removed.removed, 1);

    auto s = coord->stats();
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(s.total_records, 3);      // insert-time counts are kept
    EXPECT_EQ(s.stored_entries, 2);
    EXPECT_EQ(s.processed_files, 2);
}

TEST_F(IngestionCoordinatorTest, LedgerKeyIsFileName) {
    EXPECT_EQ(ledger_key("/data/dumps/a.txt"), "a.txt");
    EXPECT_EQ(ledger_key("a.txt"), "a.txt");
}
