#pragma once
// Result values returned by the ingestion pipeline
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../store/records.hpp"

namespace credingest {

enum class ErrorKind { NONE, DIRECTORY, STORE, TIMEOUT, IO };

inline const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:      return "none";
        case ErrorKind::DIRECTORY: return "directory";
        case ErrorKind::STORE:     return "store";
        case ErrorKind::TIMEOUT:   return "timeout";
        case ErrorKind::IO:        return "io";
    }
    return "??";
}

// Outcome of ingesting one file
struct FileResult {
    std::string filename;
    int64_t entries_added = 0;        // committed rows (or previously recorded count)
    bool already_processed = false;   // ledger hit, nothing ingested
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error;                // Empty on success
    int64_t duration_ms = 0;

    [[nodiscard]] bool ok() const { return error_kind == ErrorKind::NONE; }

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"filename", filename},
            {"entries_added", entries_added},
            {"already_processed", already_processed},
            {"duration_ms", duration_ms},
            {"status", ok() ? "success" : "error"}
        };
        if (!ok()) {
            j["error_kind"] = error_kind_str(error_kind);
            j["error"] = error;
        }
        return j;
    }
};

// Outcome of a whole-directory import
struct DirectoryImportResult {
    std::string directory;
    int64_t files_found = 0;
    int64_t files_skipped = 0;        // already in the ledger
    int64_t files_processed = 0;
    int64_t files_failed = 0;
    int64_t entries_added = 0;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error;
    std::vector<FileResult> files;

    [[nodiscard]] bool ok() const { return error_kind == ErrorKind::NONE; }

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"directory", directory},
            {"files_found", files_found},
            {"files_skipped", files_skipped},
            {"files_processed", files_processed},
            {"files_failed", files_failed},
            {"entries_added", entries_added},
            {"status", ok() ? "success" : "error"}
        };
        j["files"] = nlohmann::json::array();
        for (const auto& f : files) j["files"].push_back(f.to_json());
        if (!ok()) {
            j["error_kind"] = error_kind_str(error_kind);
            j["error"] = error;
        }
        return j;
    }
};

struct WatcherStatus {
    std::string directory;
    bool watcher_active = false;
    std::vector<std::string> files;             // candidate files currently on disk
    std::vector<std::string> processed_files;   // in-memory ledger
    int64_t processed_count = 0;

    nlohmann::json to_json() const {
        return {
            {"watching", directory},
            {"watcher_active", watcher_active},
            {"file_count", files.size()},
            {"files", files},
            {"processed", processed_count},
            {"processed_files", processed_files},
            {"status", "success"}
        };
    }
};

struct DuplicateReport {
    int64_t found = 0;
    int64_t removed = 0;
    bool remove_requested = false;
    std::vector<CredentialEntry> rows;    // every non-representative row
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error;

    [[nodiscard]] bool ok() const { return error_kind == ErrorKind::NONE; }

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"duplicates_found", found},
            {"status", ok() ? "success" : "error"}
        };
        if (remove_requested) j["duplicates_removed"] = removed;
        j["duplicates"] = nlohmann::json::array();
        for (const auto& r : rows) j["duplicates"].push_back(r.to_json());
        if (!ok()) {
            j["error_kind"] = error_kind_str(error_kind);
            j["error"] = error;
        }
        return j;
    }
};

// Ledger listing, newest first
struct ProcessedListing {
    std::vector<ProcessedFileRecord> records;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error;

    [[nodiscard]] bool ok() const { return error_kind == ErrorKind::NONE; }

    nlohmann::json to_json() const {
        nlohmann::json j = {{"status", ok() ? "success" : "error"}};
        j["files"] = nlohmann::json::array();
        for (const auto& r : records) j["files"].push_back(r.to_json());
        if (!ok()) {
            j["error_kind"] = error_kind_str(error_kind);
            j["error"] = error;
        }
        return j;
    }
};

struct IngestStats {
    int64_t total_records = 0;      // SUM(entries_added) over the ledger
    int64_t stored_entries = 0;     // rows currently in the entries table
    int64_t processed_files = 0;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error;

    [[nodiscard]] bool ok() const { return error_kind == ErrorKind::NONE; }

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"totalRecords", total_records},
            {"storedEntries", stored_entries},
            {"processedFiles", processed_files},
            {"status", ok() ? "success" : "error"}
        };
        if (!ok()) {
            j["error_kind"] = error_kind_str(error_kind);
            j["error"] = error;
        }
        return j;
    }
};

} // namespace credingest
