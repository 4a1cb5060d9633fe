#pragma once
// PostgreSQL credential store -- one libpq connection per instance.
// Instances are pooled by ConnectionPool; never shared between threads.
#include "credential_store.hpp"
#include <libpq-fe.h>

namespace credingest {

class PostgresStore : public CredentialStore {
public:
    PostgresStore() = default;
    ~PostgresStore() override { disconnect(); }

    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

    bool connect(const StoreConnection& conn) override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;
    bool reconnect(const StoreConnection& conn) override;

    bool create_schema() override;

    bool begin() override;
    bool commit() override;
    bool rollback() override;

    bool load_processed_filenames(std::unordered_set<std::string>& out) override;
    std::optional<int64_t> lookup_processed(const std::string& filename, bool& ok) override;
    bool upsert_processed(const std::string& filename, int64_t entries_added) override;
    bool list_processed(std::vector<ProcessedFileRecord>& out) override;
    bool total_entries_added(int64_t& out) override;

    bool insert_batch(const std::vector<ParsedTriple>& batch,
                      const std::string& ingested_on) override;
    bool find_duplicates(std::vector<CredentialEntry>& out, bool lock_rows) override;
    bool delete_entries(const std::vector<int64_t>& ids, int64_t& deleted) override;
    bool count_entries(int64_t& out) override;

    [[nodiscard]] const char* backend_name() const override { return "postgresql"; }

private:
    PGconn* conn_ = nullptr;
    std::string schema_;       // quoted identifier
    std::string entries_;      // schema.entries
    std::string processed_;    // schema.processed_log_files

    // Execute SQL with error checking, returns true on success
    bool exec(const char* sql);
    // Execute SQL and return result set (caller must PQclear)
    PGresult* query(const char* sql);
    // Parameterized text-format statement; caller must PQclear a non-null result
    PGresult* exec_params(const std::string& sql, const std::vector<const char*>& values,
                          ExecStatusType expected);
};

} // namespace credingest
