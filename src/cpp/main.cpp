// =============================================================================
// cred-ingest -- credential dump ingestion service
//
// Watches a data directory for *.txt dumps, parses every line into
// (url, username, password) and stores the rows in PostgreSQL. Each file is
// ingested at most once; the processed_log_files ledger remembers which.
//
// One mode per invocation:
//   --watch              ingest existing and newly created files until SIGINT/SIGTERM
//   --import [DIR]       ingest every unprocessed file in DIR once
//   --process-file PATH  ingest one file (ledger-checked)
//   --status             watcher view of the directory and ledger
//   --duplicates         list duplicate rows (--remove deletes them)
//   --processed          ledger listing, newest first
//   --stats              totals
// Results are printed as JSON on stdout, logs go to stderr.
// =============================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "ingest/ingestion_coordinator.hpp"
#include "ingest/processed_ledger.hpp"
#include "store/connection_pool.hpp"
#include "store/postgres_store.hpp"
#include "utils/logger.hpp"

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) { g_stop_requested.store(true); }

enum class Mode { NONE, WATCH, IMPORT, PROCESS_FILE, STATUS, DUPLICATES, PROCESSED, STATS };

void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s MODE [OPTIONS]\n"
        "\n"
        "Modes:\n"
        "  --watch              Watch the data directory until SIGINT/SIGTERM\n"
        "  --import [DIR]       Import every unprocessed file (default: data directory)\n"
        "  --process-file PATH  Ingest a single file\n"
        "  --status             Show watched files and the processed-file ledger\n"
        "  --duplicates         List duplicate entries\n"
        "      --remove         ... and delete them (keeps the earliest row per group)\n"
        "  --processed          List processed files, newest first\n"
        "  --stats              Show entry totals\n"
        "\n"
        "Options:\n"
        "  --config PATH        JSON config file (default: built-in defaults)\n"
        "  --data-dir PATH      Watched directory (default: ./data)\n"
        "  --database-url URL   libpq conninfo or URI (env DATABASE_URL also works)\n"
        "  --workers N          Worker threads (default: 4)\n"
        "  --verbose            Enable debug logging\n"
        "  --help               Show this help\n",
        prog);
}

void print_json(const nlohmann::json& j) {
    std::printf("%s\n", j.dump(2).c_str());
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string data_dir;
    std::string database_url;
    std::string mode_arg;
    size_t workers = 0;
    bool remove = false;
    Mode mode = Mode::NONE;

    auto set_mode = [&](Mode m) {
        if (mode != Mode::NONE && mode != m) {
            std::fprintf(stderr, "Only one mode may be given\n");
            return false;
        }
        mode = m;
        return true;
    };

    for (int i = 1; i < argc; i++) {
        bool ok = true;
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--watch") == 0) {
            ok = set_mode(Mode::WATCH);
        } else if (std::strcmp(argv[i], "--import") == 0) {
            ok = set_mode(Mode::IMPORT);
            if (i + 1 < argc && std::strncmp(argv[i + 1], "--", 2) != 0) mode_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--process-file") == 0 && i + 1 < argc) {
            ok = set_mode(Mode::PROCESS_FILE);
            mode_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--status") == 0) {
            ok = set_mode(Mode::STATUS);
        } else if (std::strcmp(argv[i], "--duplicates") == 0) {
            ok = set_mode(Mode::DUPLICATES);
        } else if (std::strcmp(argv[i], "--remove") == 0) {
            remove = true;
        } else if (std::strcmp(argv[i], "--processed") == 0) {
            ok = set_mode(Mode::PROCESSED);
        } else if (std::strcmp(argv[i], "--stats") == 0) {
            ok = set_mode(Mode::STATS);
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--data-dir") == 0 && i + 1 < argc) {
            data_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--database-url") == 0 && i + 1 < argc) {
            database_url = argv[++i];
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            workers = std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            credingest::g_log_level = credingest::LogLevel::DEBUG;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
        if (!ok) return 1;
    }

    if (mode == Mode::NONE) {
        print_usage(argv[0]);
        return 1;
    }
    if (remove && mode != Mode::DUPLICATES) {
        std::fprintf(stderr, "--remove is only valid with --duplicates\n");
        return 1;
    }

    // Configuration: file < environment < flags
    credingest::IngestConfig cfg;
    if (!config_path.empty()) {
        cfg = credingest::IngestConfig::from_json(config_path);
    }
    cfg.apply_environment();
    if (!data_dir.empty()) cfg.data_dir = data_dir;
    if (!database_url.empty()) cfg.store.conninfo = database_url;
    if (workers > 0) cfg.worker_threads = workers;

    LOG_INF("=== cred-ingest ===");
    LOG_DBG("Data directory: %s, pool size: %zu, workers: %zu",
        cfg.data_dir.c_str(), cfg.pool_size, cfg.worker_threads);

    credingest::ConnectionPool pool(
        [] { return std::make_unique<credingest::PostgresStore>(); },
        cfg.store, cfg.pool_size);
    if (!pool.open()) {
        LOG_ERR("No database connections established. Exiting.");
        return 1;
    }

    credingest::ProcessedLedger ledger;
    {
        credingest::Lease lease = pool.acquire();
        if (!lease || !lease->create_schema()) {
            LOG_ERR("Failed to create tables. Exiting.");
            return 1;
        }
        if (!ledger.load(*lease)) {
            LOG_ERR("Failed to load processed files. Exiting.");
            return 1;
        }
    }

    credingest::IngestContext ctx(cfg, pool, ledger);
    credingest::IngestionCoordinator coordinator(ctx);
    int rc = 0;

    switch (mode) {
        case Mode::WATCH: {
            std::signal(SIGINT, handle_signal);
            std::signal(SIGTERM, handle_signal);

            std::string error;
            if (!coordinator.start_watching(cfg.data_dir, &error)) {
                print_json({{"status", "error"}, {"error_kind", "directory"}, {"error", error}});
                rc = 1;
                break;
            }
            while (!g_stop_requested.load() && coordinator.is_watching()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            if (!g_stop_requested.load()) {
                LOG_ERR("Watcher ended unexpectedly");
                rc = 1;
            }
            LOG_INF("Shutting down...");
            coordinator.stop();
            print_json(coordinator.watcher_status().to_json());
            break;
        }
        case Mode::IMPORT: {
            auto result = coordinator.import_directory(mode_arg.empty() ? cfg.data_dir : mode_arg);
            print_json(result.to_json());
            rc = (result.ok() && result.files_failed == 0) ? 0 : 1;
            break;
        }
        case Mode::PROCESS_FILE: {
            auto result = coordinator.process_single_file(mode_arg);
            print_json(result.to_json());
            rc = result.ok() ? 0 : 1;
            break;
        }
        case Mode::STATUS:
            print_json(coordinator.watcher_status().to_json());
            break;
        case Mode::DUPLICATES: {
            auto report = coordinator.list_duplicates(remove);
            print_json(report.to_json());
            rc = report.ok() ? 0 : 1;
            break;
        }
        case Mode::PROCESSED: {
            auto listing = coordinator.list_processed();
            print_json(listing.to_json());
            rc = listing.ok() ? 0 : 1;
            break;
        }
        case Mode::STATS: {
            auto s = coordinator.stats();
            print_json(s.to_json());
            rc = s.ok() ? 0 : 1;
            break;
        }
        case Mode::NONE:
            break;
    }

    coordinator.stop();
    pool.close();
    return rc;
}
