#include "capsync_client.hpp"
#include <curl/curl.h>
#include "fsUtils/fsUtils.hpp"
#include "local_store/rocks_store.hpp"
#include "logger/Mylogger.hpp"

namespace
{
    constexpr int64_t QUEUE_POLL_MS = 1000;
}

CapsyncClient::CapsyncClient(const config::EngineConfig &cfg, ClientComponents components)
    : cfg_(cfg),
      clock_(components.clock ? components.clock : clock_source::systemClock()),
      token_(std::make_shared<auth::TokenHolder>()),
      queue_timer_(io_)
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
    token_->set(cfg_.auth_token);

    store_ = components.store;
    if (!store_)
    {
        if (!fsUtils::ensureParentDirectory(cfg_.store_path))
            throw errors::SyncError(errors::ErrorKind::Storage, "Cannot create directory for " + cfg_.store_path);
        store_ = std::make_shared<local_store::RocksStore>(cfg_.store_path);
    }

    transport_ = components.transport;
    if (!transport_)
    {
        transport::CurlOptions options;
        options.base_url = cfg_.server_url;
        options.timeout_ms = static_cast<long>(cfg_.transport_timeout_ms);
        options.retries = cfg_.transport_retries;
        transport_ = std::make_shared<transport::CurlTransport>(options, token_);
    }

    network_ = components.network ? components.network : std::make_shared<network::SysfsNetworkObserver>();
    processor_ = components.processor ? components.processor
                                      : std::make_shared<processor::CommandProcessor>(cfg_.processor_command);
    api_ = components.api ? components.api
                          : std::make_shared<sync_api::HttpSyncApi>(cfg_.server_url, cfg_.transport_timeout_ms, token_);

    processing_queue::QueueOptions queueOptions;
    queueOptions.max_retries = cfg_.queue_max_retries;
    queueOptions.backoff = backoff::Policy{cfg_.backoff_base_ms, cfg_.backoff_cap_ms};
    queue_ = std::make_unique<processing_queue::ProcessingQueue>(store_, clock_, queueOptions);
    worker_ = std::make_unique<processing_queue::QueueWorker>(*queue_, *processor_);
    worker_->setOnCompleted([this](const models::QueueItem &item)
                            { onCaptureProcessed(item); });
    recovery_ = std::make_unique<crash_recovery::CrashRecovery>(store_, *queue_, clock_);

    uploader_ = std::make_shared<chunked_upload::ChunkedUploader>(store_, transport_, clock_, cfg_.chunk_size_bytes);
    entities_ = std::make_shared<entity_store::EntityStore>(store_, clock_);
    resolver_ = std::make_shared<conflict_resolver::ConflictResolver>(store_, clock_, cfg_.conflict_tolerance_ms);

    sync_orchestrator::OrchestratorOptions syncOptions;
    syncOptions.batch_size = cfg_.sync_batch_size;
    syncOptions.connectivity_poll_ms = cfg_.connectivity_poll_ms;
    syncOptions.request_retries = cfg_.sync_retries;
    orchestrator_ = std::make_shared<sync_orchestrator::SyncOrchestrator>(
        io_, network_, uploader_, entities_, resolver_, api_, token_, clock_, syncOptions);
    periodic_ = std::make_unique<periodic_sync::PeriodicSync>(
        io_, network_, orchestrator_, std::chrono::milliseconds(cfg_.periodic_interval_ms));
}

CapsyncClient::~CapsyncClient()
{
    stop();
    curl_global_cleanup();
}

crash_recovery::RecoveryReport CapsyncClient::initialize()
{
    auto report = recovery_->recover();
    queue_->purgeCompleted();
    initialized_ = true;
    MyLogger::info("Client >> initialized, " + std::to_string(report.recovered.size()) + " recovered, " +
                   std::to_string(report.failed.size()) + " failed, " +
                   std::to_string(report.resumableUploads.size()) + " uploads to resume");
    return report;
}

void CapsyncClient::start()
{
    if (!initialized_)
        throw std::runtime_error("Client not initialized properly");
    if (started_)
        return;
    started_ = true;

    // Timers are armed before the loop thread exists; afterwards they are
    // only touched from that thread.
    io_.restart();
    work_ = std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(io_));
    orchestrator_->start();
    periodic_->start();
    scheduleQueuePoll();
    postDrain();

    io_thread_ = std::thread([this]
                             { io_.run(); });
    MyLogger::info("Client >> started");
}

void CapsyncClient::stop()
{
    if (!started_.exchange(false))
        return;

    // A running handler (sync pass, queue job) finishes before run() returns.
    work_.reset();
    io_.stop();
    if (io_thread_.joinable())
        io_thread_.join();

    periodic_->stop();
    orchestrator_->stop();
    queue_timer_.cancel();
    MyLogger::info("Client >> stopped");
}

models::QueueItem CapsyncClient::enqueueCapture(const std::string &capture_id,
                                                const std::string &source_path,
                                                std::optional<double> source_duration)
{
    auto item = queue_->enqueue(capture_id, source_path, source_duration);
    postDrain();
    return item;
}

models::EntityRecord CapsyncClient::recordLocalChange(const std::string &entity_type,
                                                      const std::string &entity_id,
                                                      const json &payload)
{
    auto entity = entities_->upsertLocal(entity_type, entity_id, payload);
    orchestrator_->notifyLocalChange();
    return entity;
}

void CapsyncClient::setAuthToken(const std::string &token)
{
    orchestrator_->setAuthToken(token);
}

json CapsyncClient::status()
{
    json j = orchestrator_->currentStatus().toJson();
    j["queue"] = queue_->stats().toJson();
    j["queuePaused"] = queue_->isPaused();
    j["unresolvedConflicts"] = resolver_->listUnresolved().size();
    return j;
}

void CapsyncClient::onCaptureProcessed(const models::QueueItem &item)
{
    auto size = fsUtils::regularFileSize(item.sourcePath);
    if (!size || *size <= 0)
    {
        MyLogger::warning("Client >> processed capture " + item.captureId + " has no file to upload");
        return;
    }

    // One upload id per attempt so an earlier Failed record is left alone.
    auto previous = uploader_->findByCapture(item.captureId);
    if (previous && previous->status == models::UploadStatus::InProgress)
    {
        MyLogger::info("Client >> capture " + item.captureId + " already uploading as " + previous->uploadId);
        orchestrator_->notifyLocalChange();
        return;
    }
    const std::string upload_id = previous ? models::generateId("up_" + item.captureId, clock_())
                                           : "up_" + item.captureId;

    try
    {
        uploader_->registerUpload(upload_id, item.captureId, item.sourcePath, *size);
    }
    catch (const errors::SyncError &e)
    {
        MyLogger::warning(std::string("Client >> upload not registered: ") + e.what());
        return;
    }
    orchestrator_->notifyLocalChange();
}

void CapsyncClient::scheduleQueuePoll()
{
    queue_timer_.expires_after(std::chrono::milliseconds(QUEUE_POLL_MS));
    queue_timer_.async_wait([this](const boost::system::error_code &ec)
                            {
                                if (ec == boost::asio::error::operation_aborted || !started_)
                                    return;
                                worker_->drain();
                                scheduleQueuePoll(); });
}

void CapsyncClient::postDrain()
{
    if (!started_)
        return;
    boost::asio::post(io_, [this]
                      {
                          if (started_)
                              worker_->drain(); });
}
