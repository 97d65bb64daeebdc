#include <gtest/gtest.h>

#include <memory>

#include "local_store/memory_store.hpp"
#include "local_store/rocks_store.hpp"
#include "mocks.hpp"

using local_store::LocalStore;
using local_store::OrderBy;

// Shared contract checks, run against both backends.
class LocalStoreContractTest : public ::testing::TestWithParam<std::string>
{
protected:
    void SetUp() override
    {
        if (GetParam() == "memory")
            store_ = std::make_unique<local_store::MemoryStore>();
        else
            store_ = std::make_unique<local_store::RocksStore>(dir_.file("rocks"));
    }

    void TearDown() override
    {
        store_.reset();
    }

    testing_support::TempDir dir_;
    std::unique_ptr<LocalStore> store_;
};

TEST_P(LocalStoreContractTest, PutGetRemove)
{
    EXPECT_FALSE(store_->get("items", "a").has_value());
    ASSERT_TRUE(store_->put("items", "a", json{{"n", 1}}));
    auto record = store_->get("items", "a");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ((*record)["n"], 1);

    ASSERT_TRUE(store_->put("items", "a", json{{"n", 2}}));
    EXPECT_EQ((*store_->get("items", "a"))["n"], 2);

    ASSERT_TRUE(store_->remove("items", "a"));
    EXPECT_FALSE(store_->get("items", "a").has_value());
}

TEST_P(LocalStoreContractTest, CollectionsAreIsolated)
{
    ASSERT_TRUE(store_->put("items", "a", json{{"n", 1}}));
    ASSERT_TRUE(store_->put("items_archive", "a", json{{"n", 2}}));
    ASSERT_TRUE(store_->put("other", "a", json{{"n", 3}}));

    auto items = store_->queryOrdered("items", local_store::matchAll());
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0]["n"], 1);
}

TEST_P(LocalStoreContractTest, QueryFiltersAndOrders)
{
    ASSERT_TRUE(store_->put("q", "x", json{{"status", "pending"}, {"createdAt", 30}}));
    ASSERT_TRUE(store_->put("q", "y", json{{"status", "pending"}, {"createdAt", 10}}));
    ASSERT_TRUE(store_->put("q", "z", json{{"status", "failed"}, {"createdAt", 20}}));

    auto pending = store_->queryOrdered("q", local_store::fieldEquals("status", "pending"),
                                        OrderBy{"createdAt", true});
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0]["createdAt"], 10);
    EXPECT_EQ(pending[1]["createdAt"], 30);

    auto all = store_->queryOrdered("q", local_store::matchAll(), OrderBy{"createdAt", false});
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]["createdAt"], 30);
    EXPECT_EQ(all[2]["createdAt"], 10);
}

INSTANTIATE_TEST_SUITE_P(Backends, LocalStoreContractTest, ::testing::Values("memory", "rocksdb"));

TEST(RocksStoreTest, RecordsSurviveReopen)
{
    testing_support::TempDir dir;
    {
        local_store::RocksStore store(dir.file("db"));
        ASSERT_TRUE(store.put("queue_items", "tq_1", json{{"status", "processing"}}));
    }
    local_store::RocksStore reopened(dir.file("db"));
    auto record = reopened.get("queue_items", "tq_1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ((*record)["status"], "processing");
}

TEST(SortRecordsTest, MissingFieldSortsLastAndOrderIsStable)
{
    std::vector<json> records = {
        json{{"id", "a"}, {"t", 2}},
        json{{"id", "b"}},
        json{{"id", "c"}, {"t", 1}},
        json{{"id", "d"}, {"t", 1}}};
    local_store::sortRecords(records, OrderBy{"t", true});
    EXPECT_EQ(records[0]["id"], "c");
    EXPECT_EQ(records[1]["id"], "d");
    EXPECT_EQ(records[2]["id"], "a");
    EXPECT_EQ(records[3]["id"], "b");
}

TEST(SortRecordsTest, MissingFieldIsNotNewestWhenDescending)
{
    std::vector<json> records = {
        json{{"id", "a"}, {"t", 1}},
        json{{"id", "b"}},
        json{{"id", "c"}, {"t", 3}},
        json{{"id", "d"}}};
    local_store::sortRecords(records, OrderBy{"t", false});
    EXPECT_EQ(records[0]["id"], "c");
    EXPECT_EQ(records[1]["id"], "a");
    EXPECT_EQ(records[2]["id"], "b");
    EXPECT_EQ(records[3]["id"], "d");
}
