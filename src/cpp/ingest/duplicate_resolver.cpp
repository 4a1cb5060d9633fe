#include "duplicate_resolver.hpp"
#include "../utils/logger.hpp"

namespace credingest {

DuplicateReport DuplicateResolver::resolve(bool remove) {
    return remove ? find_and_remove() : find_only();
}

DuplicateReport DuplicateResolver::find_only() {
    DuplicateReport report;
    if (!store_.find_duplicates(report.rows, false)) {
        report.rows.clear();
        report.error_kind = ErrorKind::STORE;
        report.error = "failed to query duplicates";
        return report;
    }
    report.found = static_cast<int64_t>(report.rows.size());
    LOG_INF("[duplicates] Found %lld duplicate rows", static_cast<long long>(report.found));
    return report;
}

DuplicateReport DuplicateResolver::find_and_remove() {
    DuplicateReport report;
    report.remove_requested = true;

    auto fail = [&](const char* msg) {
        LOG_ERR("[duplicates] %s -- nothing removed", msg);
        report.rows.clear();
        report.found = 0;
        report.removed = 0;
        report.error_kind = ErrorKind::STORE;
        report.error = msg;
        return report;
    };

    Transaction txn(store_);
    if (!txn.active()) return fail("failed to begin transaction");

    if (!store_.find_duplicates(report.rows, true)) {
        return fail("failed to query duplicates");
    }
    report.found = static_cast<int64_t>(report.rows.size());

    if (report.rows.empty()) {
        if (!txn.commit()) return fail("failed to commit transaction");
        LOG_INF("[duplicates] No duplicates to remove");
        return report;
    }

    std::vector<int64_t> ids;
    ids.reserve(report.rows.size());
    for (const auto& r : report.rows) ids.push_back(r.id);

    int64_t deleted = 0;
    if (!store_.delete_entries(ids, deleted)) {
        return fail("failed to delete duplicates");
    }
    if (deleted != report.found) {
        // Rows vanished between identification and deletion
        return fail("deleted row count does not match identified duplicates");
    }
    if (!txn.commit()) return fail("failed to commit transaction");

    report.removed = deleted;
    LOG_INF("[duplicates] Removed %lld duplicate rows", static_cast<long long>(deleted));
    return report;
}

} // namespace credingest
