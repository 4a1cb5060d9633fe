#include "postgres_store.hpp"
#include "../utils/logger.hpp"
#include <cstdlib>
#include <cstring>

namespace credingest {

bool PostgresStore::connect(const StoreConnection& conn) {
    std::string timeout = std::to_string(conn.connect_timeout_sec);

    // expand_dbname=1: "dbname" may carry a full conninfo string or URI
    const char* keywords[] = {"dbname", "application_name", "connect_timeout", nullptr};
    const char* values[] = {conn.conninfo.c_str(), conn.application_name.c_str(),
                            timeout.c_str(), nullptr};

    conn_ = PQconnectdbParams(keywords, values, 1);
    if (PQstatus(conn_) != CONNECTION_OK) {
        LOG_ERR("[%s] Connection failed: %s", backend_name(), PQerrorMessage(conn_));
        PQfinish(conn_);
        conn_ = nullptr;
        return false;
    }

    char* ident = PQescapeIdentifier(conn_, conn.schema.c_str(), conn.schema.size());
    if (!ident) {
        LOG_ERR("[%s] Invalid schema name %s: %s",
            backend_name(), conn.schema.c_str(), PQerrorMessage(conn_));
        PQfinish(conn_);
        conn_ = nullptr;
        return false;
    }
    schema_ = ident;
    PQfreemem(ident);
    entries_ = schema_ + ".entries";
    processed_ = schema_ + ".processed_log_files";

    LOG_DBG("[%s] Connected to %s:%s/%s (server %s)",
        backend_name(), PQhost(conn_), PQport(conn_), PQdb(conn_),
        PQparameterStatus(conn_, "server_version"));
    return true;
}

void PostgresStore::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresStore::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PostgresStore::reconnect(const StoreConnection& conn) {
    if (conn_) {
        // PQreset reuses existing connection parameters -- faster than full reconnect
        PQreset(conn_);
        if (PQstatus(conn_) == CONNECTION_OK) {
            LOG_INF("[%s] PQreset successful", backend_name());
            return true;
        }
        LOG_WRN("[%s] PQreset failed: %s -- falling back to full reconnect",
            backend_name(), PQerrorMessage(conn_));
    }
    disconnect();
    return connect(conn);
}

bool PostgresStore::exec(const char* sql) {
    if (!conn_) return false;
    PGresult* res = PQexec(conn_, sql);
    bool ok = (PQresultStatus(res) == PGRES_COMMAND_OK ||
               PQresultStatus(res) == PGRES_TUPLES_OK);
    if (!ok) {
        LOG_ERR("[%s] SQL error: %s\n  SQL: %s", backend_name(), PQerrorMessage(conn_), sql);
    }
    PQclear(res);
    return ok;
}

PGresult* PostgresStore::query(const char* sql) {
    if (!conn_) return nullptr;
    PGresult* res = PQexec(conn_, sql);
    if (PQresultStatus(res) != PGRES_TUPLES_OK) {
        LOG_ERR("[%s] Query error: %s", backend_name(), PQerrorMessage(conn_));
        PQclear(res);
        return nullptr;
    }
    return res;
}

PGresult* PostgresStore::exec_params(const std::string& sql,
                                     const std::vector<const char*>& values,
                                     ExecStatusType expected) {
    if (!conn_) return nullptr;
    PGresult* res = PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
        nullptr, values.data(), nullptr, nullptr, 0);
    if (PQresultStatus(res) != expected) {
        LOG_ERR("[%s] Statement error: %s", backend_name(), PQerrorMessage(conn_));
        PQclear(res);
        return nullptr;
    }
    return res;
}

// --- Schema ---

bool PostgresStore::create_schema() {
    LOG_INF("[%s] Ensuring schema %s", backend_name(), schema_.c_str());

    std::string sql = "CREATE SCHEMA IF NOT EXISTS " + schema_;
    if (!exec(sql.c_str())) return false;

    sql = "CREATE TABLE IF NOT EXISTS " + entries_ + " ("
          "  id BIGSERIAL PRIMARY KEY,"
          "  url TEXT NOT NULL,"
          "  username TEXT NOT NULL,"
          "  password TEXT NOT NULL,"
          "  ingested_on TEXT NOT NULL"
          ")";
    if (!exec(sql.c_str())) return false;

    sql = "CREATE TABLE IF NOT EXISTS " + processed_ + " ("
          "  filename TEXT PRIMARY KEY,"
          "  processed_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
          "  entries_added BIGINT NOT NULL DEFAULT 0"
          ")";
    return exec(sql.c_str());
}

// --- Transactions ---

bool PostgresStore::begin() { return exec("BEGIN"); }
bool PostgresStore::commit() { return exec("COMMIT"); }
bool PostgresStore::rollback() { return exec("ROLLBACK"); }

// --- Ledger ---

bool PostgresStore::load_processed_filenames(std::unordered_set<std::string>& out) {
    std::string sql = "SELECT filename FROM " + processed_;
    PGresult* res = query(sql.c_str());
    if (!res) return false;

    int nrows = PQntuples(res);
    for (int i = 0; i < nrows; ++i) {
        out.emplace(PQgetvalue(res, i, 0));
    }
    PQclear(res);
    return true;
}

std::optional<int64_t> PostgresStore::lookup_processed(const std::string& filename, bool& ok) {
    std::string sql = "SELECT entries_added FROM " + processed_ + " WHERE filename = $1";
    PGresult* res = exec_params(sql, {filename.c_str()}, PGRES_TUPLES_OK);
    ok = (res != nullptr);
    if (!res) return std::nullopt;

    std::optional<int64_t> count;
    if (PQntuples(res) > 0) {
        count = std::strtoll(PQgetvalue(res, 0, 0), nullptr, 10);
    }
    PQclear(res);
    return count;
}

bool PostgresStore::upsert_processed(const std::string& filename, int64_t entries_added) {
    std::string sql = "INSERT INTO " + processed_ + " (filename, entries_added) VALUES ($1, $2) "
                      "ON CONFLICT (filename) DO UPDATE "
                      "SET processed_at = now(), entries_added = EXCLUDED.entries_added";
    std::string count = std::to_string(entries_added);
    PGresult* res = exec_params(sql, {filename.c_str(), count.c_str()}, PGRES_COMMAND_OK);
    if (!res) return false;
    PQclear(res);
    return true;
}

bool PostgresStore::list_processed(std::vector<ProcessedFileRecord>& out) {
    std::string sql = "SELECT filename, "
                      "to_char(processed_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"'), "
                      "entries_added FROM " + processed_ + " ORDER BY processed_at DESC";
    PGresult* res = query(sql.c_str());
    if (!res) return false;

    int nrows = PQntuples(res);
    out.reserve(out.size() + static_cast<size_t>(nrows));
    for (int i = 0; i < nrows; ++i) {
        ProcessedFileRecord rec;
        rec.filename = PQgetvalue(res, i, 0);
        rec.processed_at = PQgetvalue(res, i, 1);
        rec.entries_added = std::strtoll(PQgetvalue(res, i, 2), nullptr, 10);
        out.push_back(std::move(rec));
    }
    PQclear(res);
    return true;
}

bool PostgresStore::total_entries_added(int64_t& out) {
    std::string sql = "SELECT COALESCE(SUM(entries_added), 0) FROM " + processed_;
    PGresult* res = query(sql.c_str());
    if (!res) return false;
    out = PQntuples(res) > 0 ? std::strtoll(PQgetvalue(res, 0, 0), nullptr, 10) : 0;
    PQclear(res);
    return true;
}

// --- Entries ---

bool PostgresStore::insert_batch(const std::vector<ParsedTriple>& batch,
                                 const std::string& ingested_on) {
    if (batch.empty()) return true;

    // Single multi-row statement: atomic without an explicit transaction.
    // $1 is the shared ingested_on date.
    std::string sql;
    sql.reserve(80 + batch.size() * 24);
    sql += "INSERT INTO " + entries_ + " (url, username, password, ingested_on) VALUES ";

    std::vector<const char*> values;
    values.reserve(1 + batch.size() * 3);
    values.push_back(ingested_on.c_str());

    int p = 2;
    for (size_t i = 0; i < batch.size(); ++i) {
        if (i > 0) sql += ',';
        sql += "($" + std::to_string(p) + ",$" + std::to_string(p + 1) +
               ",$" + std::to_string(p + 2) + ",$1)";
        p += 3;
        values.push_back(batch[i].url.c_str());
        values.push_back(batch[i].username.c_str());
        values.push_back(batch[i].password.c_str());
    }

    PGresult* res = exec_params(sql, values, PGRES_COMMAND_OK);
    if (!res) return false;
    PQclear(res);
    return true;
}

bool PostgresStore::find_duplicates(std::vector<CredentialEntry>& out, bool lock_rows) {
    if (lock_rows) {
        // Window functions cannot take FOR UPDATE; block writers for the
        // rest of the transaction instead
        std::string lock = "LOCK TABLE " + entries_ + " IN SHARE ROW EXCLUSIVE MODE";
        if (!exec(lock.c_str())) return false;
    }

    std::string sql =
        "WITH ranked AS ("
        "  SELECT id, url, username, password, ingested_on,"
        "         ROW_NUMBER() OVER (PARTITION BY url, username, password ORDER BY id) AS row_num"
        "  FROM " + entries_ +
        ") "
        "SELECT id, url, username, password, ingested_on FROM ranked "
        "WHERE row_num > 1 ORDER BY url, username, password, id";

    PGresult* res = query(sql.c_str());
    if (!res) return false;

    int nrows = PQntuples(res);
    out.reserve(out.size() + static_cast<size_t>(nrows));
    for (int i = 0; i < nrows; ++i) {
        CredentialEntry e;
        e.id = std::strtoll(PQgetvalue(res, i, 0), nullptr, 10);
        e.url = PQgetvalue(res, i, 1);
        e.username = PQgetvalue(res, i, 2);
        e.password = PQgetvalue(res, i, 3);
        e.ingested_on = PQgetvalue(res, i, 4);
        out.push_back(std::move(e));
    }
    PQclear(res);
    return true;
}

bool PostgresStore::delete_entries(const std::vector<int64_t>& ids, int64_t& deleted) {
    deleted = 0;
    if (ids.empty()) return true;

    // Array literal {1,2,3} bound as one parameter
    std::string array = "{";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) array += ',';
        array += std::to_string(ids[i]);
    }
    array += '}';

    std::string sql = "DELETE FROM " + entries_ + " WHERE id = ANY($1::bigint[])";
    PGresult* res = exec_params(sql, {array.c_str()}, PGRES_COMMAND_OK);
    if (!res) return false;
    deleted = std::strtoll(PQcmdTuples(res), nullptr, 10);
    PQclear(res);
    return true;
}

bool PostgresStore::count_entries(int64_t& out) {
    std::string sql = "SELECT COUNT(*) FROM " + entries_;
    PGresult* res = query(sql.c_str());
    if (!res) return false;
    out = PQntuples(res) > 0 ? std::strtoll(PQgetvalue(res, 0, 0), nullptr, 10) : 0;
    PQclear(res);
    return true;
}

} // namespace credingest
