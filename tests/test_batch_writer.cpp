// =============================================================================
// BatchWriter Tests
// =============================================================================

#include <gtest/gtest.h>
#include <set>

#include "ingest/batch_writer.hpp"
#include "memory_store.hpp"

using namespace credingest;
using namespace credingest::testing_support;

class BatchWriterTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryDatabase> db = std::make_shared<MemoryDatabase>();
    MemoryStore store{db};

    void SetUp() override { ASSERT_TRUE(store.connect(StoreConnection())); }

    static ParsedTriple triple(int i) {
        return {"https://site" + std::to_string(i) + ".com", "user", "pw" + std::to_string(i)};
    }
};

TEST_F(BatchWriterTest, FlushesFullBatchesAndFinalPartial) {
    BatchWriter writer(store, "2024-05-01");
    for (int i = 0; i < 2500; ++i) ASSERT_TRUE(writer.add(triple(i)));
    EXPECT_EQ(writer.batches_flushed(), 2);
    EXPECT_EQ(writer.buffered(), 500u);

    ASSERT_TRUE(writer.finish());
    EXPECT_EQ(writer.batches_flushed(), 3);
    EXPECT_EQ(writer.committed(), 2500);
    EXPECT_EQ(db->insert_calls, 3);
    EXPECT_EQ(db->entry_count(), 2500u);
    EXPECT_FALSE(writer.failed());
}

TEST_F(BatchWriterTest, PreservesLineOrderAndStampsOneDate) {
    BatchWriter writer(store, "2024-05-01", 3);
    for (int i = 0; i < 7; ++i) writer.add(triple(i));
    ASSERT_TRUE(writer.finish());

    auto rows = db->snapshot_entries();
    ASSERT_EQ(rows.size(), 7u);
    std::set<std::string> dates;
    for (size_t i = 0; i < rows.size(); ++i) {
        EXPECT_EQ(rows[i].password, "pw" + std::to_string(i));
        dates.insert(rows[i].ingested_on);
    }
    EXPECT_EQ(dates.size(), 1u);
    EXPECT_EQ(*dates.begin(), "2024-05-01");
}

TEST_F(BatchWriterTest, FailedFlushReportsOnlyEarlierBatches) {
    db->fail_insert_call = 2;
    BatchWriter writer(store, "2024-05-01");

    int accepted = 0;
    for (int i = 0; i < 2500; ++i) {
        if (!writer.add(triple(i))) break;
        ++accepted;
    }
    EXPECT_EQ(accepted, 1999);   // the 2000th add triggered the failing flush
    EXPECT_TRUE(writer.failed());
    EXPECT_EQ(writer.error_kind(), ErrorKind::STORE);
    EXPECT_EQ(writer.committed(), 1000);
    EXPECT_EQ(db->entry_count(), 1000u);

    // Stopped for good
    EXPECT_FALSE(writer.add(triple(9999)));
    EXPECT_FALSE(writer.finish());
    EXPECT_EQ(db->insert_calls, 2);
}

TEST_F(BatchWriterTest, FinishWithNothingBufferedIsNoop) {
    BatchWriter writer(store, "2024-05-01");
    EXPECT_TRUE(writer.finish());
    EXPECT_TRUE(writer.finish());
    EXPECT_EQ(db->insert_calls, 0);
    EXPECT_EQ(writer.committed(), 0);
}

TEST_F(BatchWriterTest, CancellationStopsAtBatchBoundary) {
    CancellationSource source;
    BatchWriter writer(store, "2024-05-01", 10, source.token());

    for (int i = 0; i < 10; ++i) writer.add(triple(i));
    EXPECT_EQ(writer.committed(), 10);

    source.cancel();
    for (int i = 10; i < 19; ++i) EXPECT_TRUE(writer.add(triple(i)));
    EXPECT_FALSE(writer.add(triple(19)));

    EXPECT_EQ(writer.error_kind(), ErrorKind::TIMEOUT);
    EXPECT_EQ(writer.error(), "ingestion cancelled");
    EXPECT_EQ(writer.committed(), 10);
    EXPECT_EQ(db->entry_count(), 10u);
}

TEST_F(BatchWriterTest, ExpiredDeadlineReportsTimeout) {
    CancellationToken token = CancellationToken().with_timeout(std::chrono::milliseconds(0));
    BatchWriter writer(store, "2024-05-01", 5, token);
    writer.add(triple(1));
    EXPECT_FALSE(writer.finish());
    EXPECT_EQ(writer.error_kind(), ErrorKind::TIMEOUT);
    EXPECT_EQ(writer.error(), "ingestion timed out");
    EXPECT_EQ(db->insert_calls, 0);
}
