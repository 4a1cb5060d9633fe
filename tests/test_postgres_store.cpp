// =============================================================================
// PostgresStore Integration Tests
//
// Needs a reachable server: set CREDINGEST_TEST_DATABASE_URL (libpq conninfo
// or URI). Runs in a throwaway schema that is dropped afterwards.
// =============================================================================

#include <gtest/gtest.h>
#include <libpq-fe.h>
#include <cstdlib>
#include <string>

#include "ingest/duplicate_resolver.hpp"
#include "store/postgres_store.hpp"

using namespace credingest;

class PostgresStoreTest : public ::testing::Test {
protected:
    StoreConnection conn;
    PostgresStore store;

    void SetUp() override {
        const char* url = std::getenv("CREDINGEST_TEST_DATABASE_URL");
        if (!url || !url[0]) {
            GTEST_SKIP() << "CREDINGEST_TEST_DATABASE_URL not set";
        }
        conn.conninfo = url;
        conn.schema = "credingest_test";
        conn.connect_timeout_sec = 5;

        if (!store.connect(conn)) {
            GTEST_SKIP() << "Database connection failed";
        }
        drop_schema();
        ASSERT_TRUE(store.create_schema());
    }

    void TearDown() override {
        if (store.is_connected()) {
            store.disconnect();
            drop_schema();
        }
    }

    void drop_schema() {
        PGconn* raw = PQconnectdb(conn.conninfo.c_str());
        if (PQstatus(raw) == CONNECTION_OK) {
            PGresult* res = PQexec(raw, "DROP SCHEMA IF EXISTS credingest_test CASCADE");
            PQclear(res);
        }
        PQfinish(raw);
    }
};

TEST_F(PostgresStoreTest, SchemaCreationIsIdempotent) {
    EXPECT_TRUE(store.create_schema());
    int64_t n = -1;
    ASSERT_TRUE(store.count_entries(n));
    EXPECT_EQ(n, 0);
}

TEST_F(PostgresStoreTest, InsertBatchAndCount) {
    std::vector<ParsedTriple> batch = {
        {"https://a.com", "u1", "p'1"},
        {"https://b.com", "u2", "p\\2"},
        {"android://x@pkg/", "u3", "p:3:with:colons"},
    };
    ASSERT_TRUE(store.insert_batch(batch, "2024-05-01"));
    int64_t n = 0;
    ASSERT_TRUE(store.count_entries(n));
    EXPECT_EQ(n, 3);

    EXPECT_TRUE(store.insert_batch({}, "2024-05-01"));
}

TEST_F(PostgresStoreTest, LedgerUpsertLastWriteWins) {
    ASSERT_TRUE(store.upsert_processed("dump.txt", 500));
    ASSERT_TRUE(store.upsert_processed("dump.txt", 7));
    ASSERT_TRUE(store.upsert_processed("other.txt", 3));

    bool ok = false;
    auto n = store.lookup_processed("dump.txt", ok);
    ASSERT_TRUE(ok);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 7);

    EXPECT_FALSE(store.lookup_processed("missing.txt", ok).has_value());
    EXPECT_TRUE(ok);

    std::unordered_set<std::string> names;
    ASSERT_TRUE(store.load_processed_filenames(names));
    EXPECT_EQ(names.size(), 2u);

    std::vector<ProcessedFileRecord> records;
    ASSERT_TRUE(store.list_processed(records));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].filename, "other.txt");

    int64_t total = 0;
    ASSERT_TRUE(store.total_entries_added(total));
    EXPECT_EQ(total, 10);
}

TEST_F(PostgresStoreTest, DuplicateRemovalInTransaction) {
    ASSERT_TRUE(store.insert_batch({
        {"https://x.com", "bob", "pw"},
        {"https://y.com", "amy", "pw"},
        {"https://x.com", "bob", "pw"},
        {"https://x.com", "bob", "pw"},
    }, "2024-05-01"));

    DuplicateResolver resolver(store);
    auto listed = resolver.resolve(false);
    ASSERT_TRUE(listed.ok());
    EXPECT_EQ(listed.found, 2);

    auto removed = resolver.resolve(true);
    ASSERT_TRUE(removed.ok()) << removed.error;
    EXPECT_EQ(removed.removed, 2);

    int64_t n = 0;
    ASSERT_TRUE(store.count_entries(n));
    EXPECT_EQ(n, 2);

    std::vector<CredentialEntry> rest;
    ASSERT_TRUE(store.find_duplicates(rest, false));
    EXPECT_TRUE(rest.empty());
}

TEST_F(PostgresStoreTest, RollbackDiscardsInserts) {
    {
        Transaction txn(store);
        ASSERT_TRUE(txn.active());
        ASSERT_TRUE(store.insert_batch({{"https://z.com", "u", "p"}}, "2024-05-01"));
    }
    int64_t n = -1;
    ASSERT_TRUE(store.count_entries(n));
    EXPECT_EQ(n, 0);
}
