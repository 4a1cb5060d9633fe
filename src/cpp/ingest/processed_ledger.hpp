#pragma once
// Idempotency ledger over filenames: persistent processed_log_files rows plus
// an in-memory mirror used for fast skip checks.
//
// A file is claimed (marked known in memory) when ingestion is dispatched, so
// concurrent discoveries of the same name never double-ingest. The persistent
// row is written only once the file has been attempted. A claim whose run
// committed nothing is released again, so the file can be retried.
//
// Every method touching the in-memory set holds one mutex; record() holds it
// across the upsert as well. Store access uses the caller's connection lease
// so the ledger never waits on the pool while holding its lock.
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "../store/credential_store.hpp"

namespace credingest {

class ProcessedLedger {
public:
    ProcessedLedger() = default;

    // Replace the in-memory set with the persistent filenames
    bool load(CredentialStore& store);

    [[nodiscard]] bool is_known(const std::string& filename) const;

    // Atomically check-and-mark. False if the name is already known.
    bool try_claim(const std::string& filename);

    // Undo a claim (nothing was committed for the file)
    void release(const std::string& filename);

    // Upsert (last write wins) and mark known
    bool record(CredentialStore& store, const std::string& filename, int64_t entries_added);

    // Persistent entries_added for a file; ok=false on store failure
    std::optional<int64_t> recorded_count(CredentialStore& store, const std::string& filename,
                                          bool& ok) const;

    // Sorted copy of the in-memory set
    [[nodiscard]] std::vector<std::string> snapshot() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> known_;
};

} // namespace credingest
