#pragma once
// Abstract interface for one connection to the credential store.
// Owns durability of the entries table and the processed-files ledger.
//
// Low-level calls return bool and log the backend error text; callers turn a
// false into a StoreError for the file or operation they are running.
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>
#include "../config.hpp"
#include "../utils/logger.hpp"
#include "records.hpp"

namespace credingest {

class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual bool connect(const StoreConnection& conn) = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;

    // Idempotent: entries + processed_log_files
    virtual bool create_schema() = 0;

    // Transactions (used by the duplicate resolver)
    virtual bool begin() = 0;
    virtual bool commit() = 0;
    virtual bool rollback() = 0;

    // --- Ledger ---
    virtual bool load_processed_filenames(std::unordered_set<std::string>& out) = 0;
    // nullopt: no record; store errors are reported through `ok`
    virtual std::optional<int64_t> lookup_processed(const std::string& filename, bool& ok) = 0;
    // INSERT ... ON CONFLICT (filename) DO UPDATE -- last write wins
    virtual bool upsert_processed(const std::string& filename, int64_t entries_added) = 0;
    // Ordered by processed_at descending
    virtual bool list_processed(std::vector<ProcessedFileRecord>& out) = 0;
    virtual bool total_entries_added(int64_t& out) = 0;

    // --- Entries ---
    // One atomic multi-row insert; either all rows land or none
    virtual bool insert_batch(const std::vector<ParsedTriple>& batch,
                              const std::string& ingested_on) = 0;
    // Every row ranked > 1 within its (url, username, password) group,
    // ranking by ascending id. Ordered by url, username, password, id.
    // lock_rows: take row locks (inside a transaction) before deletion
    virtual bool find_duplicates(std::vector<CredentialEntry>& out, bool lock_rows) = 0;
    virtual bool delete_entries(const std::vector<int64_t>& ids, int64_t& deleted) = 0;
    virtual bool count_entries(int64_t& out) = 0;

    [[nodiscard]] virtual const char* backend_name() const = 0;

    // Default: disconnect + connect. Override for protocol-specific reset.
    virtual bool reconnect(const StoreConnection& conn) {
        disconnect();
        return connect(conn);
    }

    // Ensure connection is alive, retry with exponential backoff if lost.
    // Backoff: base_delay_ms * 2^(attempt-1), capped at 30s.
    bool ensure_connected(const StoreConnection& conn,
                          int max_retries = 3, int base_delay_ms = 500) {
        if (is_connected()) return true;

        LOG_WRN("[%s] Connection lost! Starting reconnection (max %d retries)...",
            backend_name(), max_retries);

        for (int attempt = 1; attempt <= max_retries; ++attempt) {
            int delay = base_delay_ms * (1 << (attempt - 1));
            if (delay > 30000) delay = 30000;

            std::this_thread::sleep_for(std::chrono::milliseconds(delay));

            if (reconnect(conn)) {
                LOG_INF("[%s] Reconnected on attempt %d", backend_name(), attempt);
                return true;
            }
            LOG_ERR("[%s] Reconnect attempt %d/%d failed", backend_name(), attempt, max_retries);
        }
        return false;
    }
};

// Rolls back on scope exit unless commit() succeeded
class Transaction {
public:
    explicit Transaction(CredentialStore& store) : store_(store) {
        active_ = store_.begin();
    }

    ~Transaction() {
        if (active_) {
            if (!store_.rollback()) {
                LOG_ERR("[%s] Rollback failed", store_.backend_name());
            }
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] bool active() const { return active_; }

    bool commit() {
        if (!active_) return false;
        active_ = false;
        return store_.commit();
    }

private:
    CredentialStore& store_;
    bool active_ = false;
};

} // namespace credingest
