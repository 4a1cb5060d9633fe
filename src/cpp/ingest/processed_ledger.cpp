#include "processed_ledger.hpp"
#include "../utils/logger.hpp"
#include <algorithm>

namespace credingest {

bool ProcessedLedger::load(CredentialStore& store) {
    std::unordered_set<std::string> names;
    if (!store.load_processed_filenames(names)) {
        LOG_ERR("[ledger] Failed to load processed files from %s", store.backend_name());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    known_ = std::move(names);
    if (!known_.empty()) {
        LOG_INF("[ledger] Loaded %zu processed files", known_.size());
    }
    return true;
}

bool ProcessedLedger::is_known(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_.count(filename) > 0;
}

bool ProcessedLedger::try_claim(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_.insert(filename).second;
}

void ProcessedLedger::release(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    known_.erase(filename);
    LOG_DBG("[ledger] Released claim on %s", filename.c_str());
}

bool ProcessedLedger::record(CredentialStore& store, const std::string& filename,
                             int64_t entries_added) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!store.upsert_processed(filename, entries_added)) {
        LOG_ERR("[ledger] Failed to record %s (%lld entries)",
            filename.c_str(), static_cast<long long>(entries_added));
        return false;
    }
    known_.insert(filename);
    return true;
}

std::optional<int64_t> ProcessedLedger::recorded_count(CredentialStore& store,
                                                       const std::string& filename,
                                                       bool& ok) const {
    return store.lookup_processed(filename, ok);
}

std::vector<std::string> ProcessedLedger::snapshot() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names.assign(known_.begin(), known_.end());
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t ProcessedLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_.size();
}

} // namespace credingest
