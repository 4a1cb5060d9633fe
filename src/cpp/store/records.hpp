#pragma once
// Row types shared by the store seam and the ingestion pipeline
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace credingest {

// One leaked credential extracted from a dump line (transient)
struct ParsedTriple {
    std::string url;
    std::string username;
    std::string password;

    bool operator==(const ParsedTriple& o) const {
        return url == o.url && username == o.username && password == o.password;
    }
};

// Persisted row of the entries table. Never updated in place.
struct CredentialEntry {
    int64_t id = 0;             // BIGSERIAL, insertion order
    std::string url;
    std::string username;
    std::string password;
    std::string ingested_on;    // YYYY-MM-DD

    nlohmann::json to_json() const {
        return {
            {"id", id},
            {"url", url},
            {"username", username},
            {"password", password},
            {"ingested_on", ingested_on}
        };
    }
};

// Ledger row: at most one per filename, upserted last-write-wins
struct ProcessedFileRecord {
    std::string filename;
    std::string processed_at;   // ISO-8601 as reported by the store
    int64_t entries_added = 0;

    nlohmann::json to_json() const {
        return {
            {"filename", filename},
            {"processed_at", processed_at},
            {"entries_added", entries_added}
        };
    }
};

} // namespace credingest
