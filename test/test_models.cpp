#include <gtest/gtest.h>

#include <regex>

#include "models/models.hpp"

TEST(ModelsTest, QueueItemJsonKeepsOptionalsAndStatus)
{
    models::QueueItem item;
    item.id = "tq_1_abc";
    item.captureId = "cap-1";
    item.sourcePath = "/tmp/a.wav";
    item.status = models::QueueStatus::Processing;
    item.retryCount = 2;
    item.createdAt = 10;
    item.updatedAt = 20;
    item.nextAttemptAt = 30;

    json j = item;
    EXPECT_EQ(j["status"], "processing");
    EXPECT_TRUE(j["sourceDuration"].is_null());
    EXPECT_TRUE(j["lastError"].is_null());

    item.sourceDuration = 12.5;
    item.lastError = "boom";
    auto back = json(item).get<models::QueueItem>();
    EXPECT_EQ(back.status, models::QueueStatus::Processing);
    EXPECT_EQ(back.retryCount, 2);
    ASSERT_TRUE(back.sourceDuration.has_value());
    EXPECT_DOUBLE_EQ(*back.sourceDuration, 12.5);
    EXPECT_EQ(back.lastError.value_or(""), "boom");
    EXPECT_EQ(back.nextAttemptAt, 30);
}

TEST(ModelsTest, TerminalStates)
{
    models::QueueItem item;
    EXPECT_FALSE(item.isTerminal());
    item.status = models::QueueStatus::Processing;
    EXPECT_FALSE(item.isTerminal());
    item.status = models::QueueStatus::Completed;
    EXPECT_TRUE(item.isTerminal());
    item.status = models::QueueStatus::Failed;
    EXPECT_TRUE(item.isTerminal());
}

TEST(ModelsTest, UnresolvedConflictStoresNullResolvedAt)
{
    models::SyncConflict conflict;
    conflict.id = "sc_1";
    conflict.entityType = "thought";
    conflict.entityId = "t1";
    conflict.localPayload = {{"text", "local"}};
    conflict.remotePayload = {{"text", "remote"}};

    json j = conflict;
    EXPECT_TRUE(j["resolvedAt"].is_null());
    EXPECT_EQ(j["resolutionStrategy"], "unresolved");

    auto back = j.get<models::SyncConflict>();
    EXPECT_FALSE(back.resolvedAt.has_value());
    EXPECT_EQ(back.localPayload["text"], "local");
    EXPECT_EQ(back.remotePayload["text"], "remote");
}

TEST(ModelsTest, GeneratedIdsCarryPrefixAndTime)
{
    auto id = models::generateId("tq", 1718000000000);
    EXPECT_TRUE(std::regex_match(id, std::regex("tq_1718000000000_[0-9a-z]{7}")));
    EXPECT_NE(models::generateId("tq", 1), models::generateId("tq", 1));
}

TEST(ModelsTest, UnknownStringsFallBackToInitialState)
{
    EXPECT_EQ(models::queueStatusFromString("bogus"), models::QueueStatus::Pending);
    EXPECT_EQ(models::uploadStatusFromString("bogus"), models::UploadStatus::InProgress);
    EXPECT_EQ(models::resolutionStrategyFromString("bogus"), models::ResolutionStrategy::Unresolved);
    EXPECT_EQ(models::toString(models::NetworkTransport::Ethernet), "ethernet");
}
