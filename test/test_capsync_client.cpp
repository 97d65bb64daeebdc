#include <gtest/gtest.h>

#include <thread>

#include "capsync_client.hpp"
#include "local_store/memory_store.hpp"
#include "mocks.hpp"

class CapsyncClientTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store_ = std::make_shared<local_store::MemoryStore>();
        transport_ = std::make_shared<testing_support::FakeTransport>();
        network_ = std::make_shared<testing_support::ManualNetworkObserver>(true);
        processor_ = std::make_shared<testing_support::ScriptedProcessor>();
        api_ = std::make_shared<testing_support::FakeSyncApi>();

        cfg_.auth_token = "t0k";
        cfg_.chunk_size_bytes = 1024;
        cfg_.periodic_interval_ms = 60 * 60 * 1000;
        cfg_.connectivity_poll_ms = 60 * 1000;
    }

    ClientComponents components()
    {
        ClientComponents c;
        c.store = store_;
        c.transport = transport_;
        c.network = network_;
        c.processor = processor_;
        c.api = api_;
        return c;
    }

    config::EngineConfig cfg_;
    testing_support::TempDir dir_;
    std::shared_ptr<local_store::MemoryStore> store_;
    std::shared_ptr<testing_support::FakeTransport> transport_;
    std::shared_ptr<testing_support::ManualNetworkObserver> network_;
    std::shared_ptr<testing_support::ScriptedProcessor> processor_;
    std::shared_ptr<testing_support::FakeSyncApi> api_;
};

TEST_F(CapsyncClientTest, StartRequiresInitialize)
{
    CapsyncClient client(cfg_, components());
    EXPECT_THROW(client.start(), std::runtime_error);
}

TEST_F(CapsyncClientTest, InitializeRecoversStrandedWork)
{
    const std::string path = dir_.file("cap.wav");
    testing_support::writeFile(path, 2048);
    {
        processing_queue::ProcessingQueue before(store_, clock_source::systemClock());
        before.openForProcessing();
        before.enqueue("cap-1", path);
        ASSERT_TRUE(before.dequeueNext().has_value());
    }

    CapsyncClient client(cfg_, components());
    auto report = client.initialize();
    ASSERT_EQ(report.recovered.size(), 1u);
    EXPECT_TRUE(client.queue().isOpen());
    EXPECT_EQ(client.queue().stats().pending, 1u);
}

TEST_F(CapsyncClientTest, StatusCombinesSyncAndQueue)
{
    CapsyncClient client(cfg_, components());
    client.initialize();
    client.enqueueCapture("cap-1", "/data/1.wav", 12.5);
    client.recordLocalChange("note", "n1", json{{"text", "hi"}});

    auto status = client.status();
    EXPECT_EQ(status["status"], "idle");
    EXPECT_EQ(status["pendingCount"], 1);
    EXPECT_EQ(status["queue"]["pending"], 1);
    EXPECT_EQ(status["queuePaused"], false);
    EXPECT_EQ(status["unresolvedConflicts"], 0);
}

TEST_F(CapsyncClientTest, ProcessedCaptureIsUploaded)
{
    const std::string path = dir_.file("cap.wav");
    testing_support::writeFile(path, 3000);

    CapsyncClient client(cfg_, components());
    client.initialize();
    client.start();
    client.enqueueCapture("cap-1", path);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    bool uploaded = false;
    while (!uploaded && std::chrono::steady_clock::now() < deadline)
    {
        auto record = client.uploader().getProgress("up_cap-1");
        uploaded = record && record->status == models::UploadStatus::Completed;
        if (!uploaded)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    client.stop();

    ASSERT_TRUE(uploaded);
    EXPECT_EQ(transport_->sent().size(), 3u);
    auto item = client.queue().findByCapture("cap-1");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->status, models::QueueStatus::Completed);
    EXPECT_GE(api_->pullCalls, 1);
}

TEST_F(CapsyncClientTest, ReprocessedCaptureGetsFreshUploadAfterFailure)
{
    const std::string path = dir_.file("cap.wav");
    testing_support::writeFile(path, 3000);

    models::UploadRecord failed;
    failed.uploadId = "up_cap-1";
    failed.captureId = "cap-1";
    failed.filePath = path;
    failed.fileSizeBytes = 3000;
    failed.chunkSizeBytes = 1024;
    failed.totalChunks = 3;
    failed.status = models::UploadStatus::Failed;
    failed.lastError = "File not found: " + path;
    failed.createdAt = 1;
    failed.updatedAt = 1;
    ASSERT_TRUE(store_->put(models::UPLOAD_RECORDS, failed.uploadId, json(failed)));

    CapsyncClient client(cfg_, components());
    client.initialize();
    client.start();
    client.enqueueCapture("cap-1", path);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    std::optional<models::UploadRecord> latest;
    while (std::chrono::steady_clock::now() < deadline)
    {
        latest = client.uploader().findByCapture("cap-1");
        if (latest && latest->status == models::UploadStatus::Completed)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    client.stop();

    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->status, models::UploadStatus::Completed);
    EXPECT_NE(latest->uploadId, "up_cap-1");
    EXPECT_EQ(client.uploader().getProgress("up_cap-1")->status, models::UploadStatus::Failed);
    EXPECT_EQ(transport_->sent().size(), 3u);
}
