#include <gtest/gtest.h>

#include <fstream>

#include "errors/errors.hpp"
#include "load_config/load_config.hpp"
#include "mocks.hpp"

using testing_support::TempDir;

class LoadConfigTest : public ::testing::Test
{
protected:
    TempDir dir_;
};

TEST_F(LoadConfigTest, DefaultsWhenKeysAbsent)
{
    auto cfg = config::fromJson(json::object());
    EXPECT_EQ(cfg.chunk_size_bytes, 5 * 1024 * 1024);
    EXPECT_EQ(cfg.transport_timeout_ms, 30000);
    EXPECT_EQ(cfg.transport_retries, 3);
    EXPECT_EQ(cfg.queue_max_retries, 3);
    EXPECT_EQ(cfg.backoff_base_ms, 2000);
    EXPECT_EQ(cfg.backoff_cap_ms, 300000);
    EXPECT_EQ(cfg.periodic_interval_ms, 15 * 60 * 1000);
    EXPECT_EQ(cfg.sync_batch_size, 100);
    EXPECT_EQ(cfg.sync_retries, 3);
}

TEST_F(LoadConfigTest, OverridesAndWrongTypesFallBack)
{
    json j = {
        {"server_url", "https://sync.example.org"},
        {"chunk_size_bytes", 1024},
        {"queue_max_retries", "five"}};
    auto cfg = config::fromJson(j);
    EXPECT_EQ(cfg.server_url, "https://sync.example.org");
    EXPECT_EQ(cfg.chunk_size_bytes, 1024);
    EXPECT_EQ(cfg.queue_max_retries, 3);
}

TEST_F(LoadConfigTest, RejectsNonPositiveSizes)
{
    EXPECT_THROW(config::fromJson(json{{"chunk_size_bytes", 0}}), errors::SyncError);
    EXPECT_THROW(config::fromJson(json{{"periodic_interval_ms", -1}}), errors::SyncError);
    EXPECT_THROW(config::fromJson(json{{"queue_max_retries", -1}}), errors::SyncError);
    EXPECT_THROW(config::fromJson(json{{"sync_retries", -2}}), errors::SyncError);
}

TEST_F(LoadConfigTest, MissingOrMalformedFileIsValidationError)
{
    try
    {
        ConfigReader::load(dir_.file("absent.json"));
        FAIL() << "expected SyncError";
    }
    catch (const errors::SyncError &e)
    {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Validation);
    }

    std::ofstream(dir_.file("broken.json")) << "{ not json";
    EXPECT_THROW(ConfigReader::load(dir_.file("broken.json")), errors::SyncError);
}

TEST_F(LoadConfigTest, SavedConfigLoadsBack)
{
    config::EngineConfig cfg;
    cfg.store_path = dir_.file("db");
    cfg.auth_token = "token-123";
    cfg.conflict_tolerance_ms = 250;
    ASSERT_TRUE(ConfigReader::save(dir_.file("capsync.json"), config::toJson(cfg)));

    auto loaded = config::loadEngineConfig(dir_.file("capsync.json"));
    EXPECT_EQ(loaded.store_path, cfg.store_path);
    EXPECT_EQ(loaded.auth_token, "token-123");
    EXPECT_EQ(loaded.conflict_tolerance_ms, 250);
}
