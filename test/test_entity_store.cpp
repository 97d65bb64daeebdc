#include <gtest/gtest.h>

#include "entity_store/entity_store.hpp"
#include "fsUtils/fsUtils.hpp"
#include "local_store/memory_store.hpp"
#include "mocks.hpp"

class EntityStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store_ = std::make_shared<local_store::MemoryStore>();
        entities_ = std::make_unique<entity_store::EntityStore>(store_, clock_.clock());
    }

    testing_support::ManualClock clock_;
    std::shared_ptr<local_store::MemoryStore> store_;
    std::unique_ptr<entity_store::EntityStore> entities_;
};

TEST_F(EntityStoreTest, LocalEditIsDirtyWithContentVersion)
{
    json payload = {{"text", "buy milk"}};
    auto entity = entities_->upsertLocal("thought", "t1", payload);
    EXPECT_TRUE(entity.dirty);
    EXPECT_EQ(entity.version, fsUtils::contentVersion(payload));
    EXPECT_EQ(entity.updatedAt, clock_.now());
    EXPECT_EQ(entities_->pendingCount(), 1u);
    EXPECT_THROW(entities_->upsertLocal("", "t1", payload), errors::SyncError);
}

TEST_F(EntityStoreTest, PendingPushSkipsConflictedAndOrdersByEdit)
{
    entities_->upsertLocal("thought", "t2", {{"n", 2}});
    clock_.advance(10);
    entities_->upsertLocal("thought", "t1", {{"n", 1}});
    clock_.advance(10);
    auto parked = entities_->upsertLocal("thought", "t3", {{"n", 3}});
    parked.conflicted = true;
    ASSERT_TRUE(entities_->save(parked));

    auto pending = entities_->pendingPush();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].entityId, "t2");
    EXPECT_EQ(pending[1].entityId, "t1");
    EXPECT_EQ(entities_->pendingPush(1).size(), 1u);
}

TEST_F(EntityStoreTest, MarkPushedKeepsLaterEditsDirty)
{
    auto pushed = entities_->upsertLocal("thought", "t1", {{"text", "v1"}});
    ASSERT_TRUE(entities_->markPushed(pushed));
    auto clean = entities_->get("thought", "t1");
    ASSERT_TRUE(clean.has_value());
    EXPECT_FALSE(clean->dirty);
    EXPECT_EQ(clean->basePayload, pushed.payload);

    auto inFlight = entities_->upsertLocal("thought", "t1", {{"text", "v2"}});
    entities_->upsertLocal("thought", "t1", {{"text", "v3"}});
    ASSERT_TRUE(entities_->markPushed(inFlight));
    auto current = entities_->get("thought", "t1");
    EXPECT_TRUE(current->dirty);
    EXPECT_EQ(current->payload["text"], "v3");
    EXPECT_EQ(current->basePayload["text"], "v2");
}

TEST_F(EntityStoreTest, ApplyRemoteBecomesBase)
{
    auto remote = testing_support::remoteEntity("thought", "t9", {{"text", "server"}}, 500);
    ASSERT_TRUE(entities_->applyRemote(remote));
    auto local = entities_->get("thought", "t9");
    ASSERT_TRUE(local.has_value());
    EXPECT_FALSE(local->dirty);
    EXPECT_EQ(local->payload, remote.payload);
    EXPECT_EQ(local->basePayload, remote.payload);
}

TEST_F(EntityStoreTest, DeleteIsADirtyTombstone)
{
    EXPECT_FALSE(entities_->markDeleted("thought", "missing"));
    auto entity = entities_->upsertLocal("thought", "t1", {{"text", "x"}});
    ASSERT_TRUE(entities_->markPushed(entity));
    ASSERT_TRUE(entities_->markDeleted("thought", "t1"));
    auto tomb = entities_->get("thought", "t1");
    EXPECT_TRUE(tomb->deleted);
    EXPECT_TRUE(tomb->dirty);
}

TEST_F(EntityStoreTest, PullCursorPersists)
{
    EXPECT_EQ(entities_->lastPulledAt(), 0);
    ASSERT_TRUE(entities_->setLastPulledAt(12345));
    entity_store::EntityStore reopened(store_, clock_.clock());
    EXPECT_EQ(reopened.lastPulledAt(), 12345);
}
