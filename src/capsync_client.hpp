#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "auth/token_holder.hpp"
#include "chunked_upload/chunked_upload.hpp"
#include "conflict_resolver/conflict_resolver.hpp"
#include "crash_recovery/crash_recovery.hpp"
#include "entity_store/entity_store.hpp"
#include "load_config/load_config.hpp"
#include "local_store/local_store.hpp"
#include "network/network_observer.hpp"
#include "periodic_sync/periodic_sync.hpp"
#include "processing_queue/processing_queue.hpp"
#include "processor/capture_processor.hpp"
#include "sync_api/sync_api.hpp"
#include "sync_orchestrator/sync_orchestrator.hpp"
#include "transport/transport.hpp"

// Collaborators the client would otherwise build from the config. Any
// member left null gets the production implementation.
struct ClientComponents
{
    std::shared_ptr<local_store::LocalStore> store;
    std::shared_ptr<transport::Transport> transport;
    std::shared_ptr<network::NetworkObserver> network;
    std::shared_ptr<processor::CaptureProcessor> processor;
    std::shared_ptr<sync_api::SyncApi> api;
    clock_source::Clock clock;
};

// Owns every engine component and the event loop they are scheduled on.
class CapsyncClient
{
public:
    explicit CapsyncClient(const config::EngineConfig &cfg, ClientComponents components = ClientComponents());
    ~CapsyncClient();

    // Runs crash recovery, then opens the queue. Must precede start().
    crash_recovery::RecoveryReport initialize();

    // Starts the event loop thread, the orchestrator and the periodic trigger.
    void start();
    void stop();

    // Queues a capture for processing and schedules the worker.
    models::QueueItem enqueueCapture(const std::string &capture_id,
                                     const std::string &source_path,
                                     std::optional<double> source_duration = std::nullopt);

    // Local edit to a syncable entity; schedules a sync.
    models::EntityRecord recordLocalChange(const std::string &entity_type,
                                           const std::string &entity_id,
                                           const json &payload);

    void setAuthToken(const std::string &token);

    // Orchestrator status plus queue counters.
    json status();

    processing_queue::ProcessingQueue &queue() { return *queue_; }
    sync_orchestrator::SyncOrchestrator &orchestrator() { return *orchestrator_; }
    conflict_resolver::ConflictResolver &resolver() { return *resolver_; }
    chunked_upload::ChunkedUploader &uploader() { return *uploader_; }

private:
    void onCaptureProcessed(const models::QueueItem &item);
    void scheduleQueuePoll();
    void postDrain();

    config::EngineConfig cfg_;
    clock_source::Clock clock_;
    boost::asio::io_context io_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread io_thread_;

    std::shared_ptr<auth::TokenHolder> token_;
    std::shared_ptr<local_store::LocalStore> store_;
    std::shared_ptr<transport::Transport> transport_;
    std::shared_ptr<network::NetworkObserver> network_;
    std::shared_ptr<processor::CaptureProcessor> processor_;
    std::shared_ptr<sync_api::SyncApi> api_;

    std::unique_ptr<processing_queue::ProcessingQueue> queue_;
    std::unique_ptr<processing_queue::QueueWorker> worker_;
    std::unique_ptr<crash_recovery::CrashRecovery> recovery_;
    std::shared_ptr<chunked_upload::ChunkedUploader> uploader_;
    std::shared_ptr<entity_store::EntityStore> entities_;
    std::shared_ptr<conflict_resolver::ConflictResolver> resolver_;
    std::shared_ptr<sync_orchestrator::SyncOrchestrator> orchestrator_;
    std::unique_ptr<periodic_sync::PeriodicSync> periodic_;

    boost::asio::steady_timer queue_timer_;
    bool initialized_ = false;
    std::atomic<bool> started_{false};
};
