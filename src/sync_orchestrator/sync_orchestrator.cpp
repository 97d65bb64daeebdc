#include "sync_orchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <set>
#include "../fsUtils/fsUtils.hpp"
#include "../logger/Mylogger.hpp"

namespace sync_orchestrator
{
    namespace
    {
        // Repeats call() while it fails with a retryable kind, sleeping
        // between attempts. Returns the last result.
        template <typename Call>
        auto withRetries(const std::string &what, const OrchestratorOptions &options, Call call) -> decltype(call())
        {
            auto result = call();
            for (int attempt = 0; attempt < options.request_retries; ++attempt)
            {
                if (result.success || !errors::isRetryable(result.kind))
                    break;
                auto delay = backoff::exponentialDelay(attempt, options.retry_backoff);
                MyLogger::warning("Sync >> " + what + " failed (" + result.err + "), retry " +
                                  std::to_string(attempt + 1) + "/" + std::to_string(options.request_retries) +
                                  " in " + std::to_string(delay) + "ms");
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
                result = call();
            }
            return result;
        }
    } // namespace

    SyncOrchestrator::SyncOrchestrator(boost::asio::io_context &io,
                                       std::shared_ptr<network::NetworkObserver> network,
                                       std::shared_ptr<chunked_upload::ChunkedUploader> uploader,
                                       std::shared_ptr<entity_store::EntityStore> entities,
                                       std::shared_ptr<conflict_resolver::ConflictResolver> resolver,
                                       std::shared_ptr<sync_api::SyncApi> api,
                                       std::shared_ptr<auth::TokenHolder> token,
                                       clock_source::Clock clock,
                                       OrchestratorOptions options)
        : io_(io),
          network_(std::move(network)),
          uploader_(std::move(uploader)),
          entities_(std::move(entities)),
          resolver_(std::move(resolver)),
          api_(std::move(api)),
          token_(std::move(token)),
          clock_(std::move(clock)),
          options_(options),
          poll_timer_(io)
    {
        if (options_.batch_size <= 0)
            throw errors::validationError("Sync batch size must be positive");
        if (options_.request_retries < 0)
            throw errors::validationError("Sync retry count must not be negative");
    }

    SyncOrchestrator::~SyncOrchestrator()
    {
        started_ = false;
        poll_timer_.cancel();
    }

    SyncReport SyncOrchestrator::sync(const SyncRequest &request)
    {
        SyncReport report;
        if (!token_ || token_->empty())
        {
            report.kind = errors::ErrorKind::Unauthenticated;
            report.error = "No auth token set";
            std::lock_guard<std::mutex> lock(mutex_);
            if (!in_flight_)
            {
                state_ = SyncState::Error;
                last_error_ = report.error;
            }
            MyLogger::warning("Sync >> " + toString(request.source) + " sync refused: no auth token");
            return report;
        }
        if (!network_->getCurrentState().connected)
        {
            report.kind = errors::ErrorKind::NetworkUnavailable;
            report.error = "Offline";
            std::lock_guard<std::mutex> lock(mutex_);
            if (!in_flight_)
                state_ = SyncState::Offline;
            MyLogger::debug("Sync >> " + toString(request.source) + " sync skipped: offline");
            return report;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (in_flight_)
        {
            if (in_flight_thread_ == std::this_thread::get_id())
            {
                report.success = true;
                report.coalesced = true;
                return report;
            }
            MyLogger::debug("Sync >> " + toString(request.source) + " sync joins the running pass");
            const uint64_t generation = generation_;
            cv_.wait(lock, [this, generation]
                     { return generation_ != generation; });
            SyncReport joined = last_report_;
            joined.coalesced = true;
            return joined;
        }
        in_flight_ = true;
        in_flight_thread_ = std::this_thread::get_id();
        state_ = SyncState::Syncing;
        lock.unlock();

        MyLogger::info("Sync >> pass started (source " + toString(request.source) +
                       ", priority " + toString(request.priority) + ")");
        try
        {
            report = runPass(request);
        }
        catch (const errors::SyncError &e)
        {
            report = SyncReport();
            recordFailure(report, e.kind(), e.what());
        }
        catch (const std::exception &e)
        {
            report = SyncReport();
            recordFailure(report, errors::ErrorKind::Storage, std::string("Corrupt local record: ") + e.what());
        }

        lock.lock();
        in_flight_ = false;
        ++generation_;
        last_report_ = report;
        if (report.success)
        {
            state_ = SyncState::Synced;
            last_sync_at_ = clock_();
            last_error_.reset();
        }
        else if (report.skipped())
        {
            state_ = SyncState::Offline;
        }
        else
        {
            state_ = SyncState::Error;
            last_error_ = report.error;
        }
        lock.unlock();
        cv_.notify_all();

        if (report.success)
            MyLogger::info("Sync >> pass finished: " + report.toJson().dump());
        else
            MyLogger::warning("Sync >> pass failed: " + report.toJson().dump());
        return report;
    }

    SyncReport SyncOrchestrator::runPass(const SyncRequest &)
    {
        SyncReport report;
        report.success = true;

        resumeUploads(report);
        if (report.kind == errors::ErrorKind::Unauthenticated)
            return report;
        if (pushChanges(report))
            pullChanges(report);
        return report;
    }

    void SyncOrchestrator::recordFailure(SyncReport &report, errors::ErrorKind kind, const std::string &error)
    {
        // The first failure is the one reported, except that an auth failure
        // always wins since nothing else can succeed without a token.
        if (report.success || kind == errors::ErrorKind::Unauthenticated)
        {
            report.kind = kind;
            report.error = error;
            report.retryable = errors::isRetryable(kind);
        }
        report.success = false;
    }

    void SyncOrchestrator::resumeUploads(SyncReport &report)
    {
        for (const auto &record : uploader_->pendingUploads())
        {
            try
            {
                auto result = uploader_->resumeUpload(record);
                if (result.success)
                {
                    ++report.uploaded;
                    continue;
                }
                recordFailure(report, result.kind, "Upload " + record.uploadId + ": " + result.err);
                if (result.kind == errors::ErrorKind::Unauthenticated)
                    return;
            }
            catch (const errors::SyncError &e)
            {
                recordFailure(report, e.kind(), "Upload " + record.uploadId + ": " + e.what());
            }
        }
    }

    bool SyncOrchestrator::pushChanges(SyncReport &report)
    {
        auto pending = entities_->pendingPush();
        const size_t batchSize = static_cast<size_t>(options_.batch_size);
        for (size_t start = 0; start < pending.size(); start += batchSize)
        {
            std::vector<models::EntityRecord> batch(pending.begin() + start,
                                                    pending.begin() + std::min(pending.size(), start + batchSize));
            auto result = withRetries("push", options_, [this, &batch]()
                                      { return api_->push(batch); });
            if (!result.success)
            {
                recordFailure(report, result.kind, "Push: " + result.err);
                return result.kind != errors::ErrorKind::Unauthenticated;
            }

            std::set<std::string> accepted(result.accepted.begin(), result.accepted.end());
            for (const auto &entity : batch)
            {
                if (accepted.count(entity.key()) && entities_->markPushed(entity))
                    ++report.uploaded;
            }
            for (const auto &remote : result.conflicts)
            {
                auto local = entities_->get(remote.entityType, remote.entityId);
                if (!local)
                {
                    if (!entities_->applyRemote(remote))
                        recordFailure(report, errors::ErrorKind::Storage, "Failed to store " + remote.key());
                    continue;
                }
                handleConflict(*local, remote, report);
            }
            MyLogger::debug("Sync >> pushed batch of " + std::to_string(batch.size()) + ", " +
                            std::to_string(accepted.size()) + " accepted");
        }
        return true;
    }

    bool SyncOrchestrator::pullChanges(SyncReport &report)
    {
        int64_t since = entities_->lastPulledAt();
        for (;;)
        {
            auto result = withRetries("pull", options_, [this, since]()
                                      { return api_->pull(since, options_.batch_size); });
            if (!result.success)
            {
                recordFailure(report, result.kind, "Pull: " + result.err);
                return false;
            }

            for (const auto &remote : result.changes)
            {
                auto local = entities_->get(remote.entityType, remote.entityId);
                if (local && local->conflicted)
                {
                    MyLogger::info("Sync >> " + local->key() + " awaits manual resolution, remote change held back");
                    continue;
                }
                if (!local || !local->dirty ||
                    (local->version == remote.version && local->deleted == remote.deleted))
                {
                    if (entities_->applyRemote(remote))
                        ++report.downloaded;
                    else
                        recordFailure(report, errors::ErrorKind::Storage, "Failed to store " + remote.key());
                    continue;
                }
                handleConflict(*local, remote, report);
            }

            const int64_t previous = since;
            if (result.serverTime > since)
            {
                since = result.serverTime;
                if (!entities_->setLastPulledAt(since))
                {
                    recordFailure(report, errors::ErrorKind::Storage, "Failed to persist pull cursor");
                    return false;
                }
            }
            if (!result.hasMore || result.changes.empty() || since <= previous)
                break;
        }
        return true;
    }

    void SyncOrchestrator::handleConflict(const models::EntityRecord &local,
                                          const models::EntityRecord &remote,
                                          SyncReport &report)
    {
        auto conflict = resolver_->resolve(local.entityType, local.entityId, local, remote, local.basePayload);
        ++report.conflicts;
        applyResolution(conflict, local, remote);
    }

    void SyncOrchestrator::applyResolution(const models::SyncConflict &conflict,
                                           models::EntityRecord local,
                                           const models::EntityRecord &remote)
    {
        bool saved = true;
        switch (conflict.resolutionStrategy)
        {
        case models::ResolutionStrategy::RemoteWins:
            saved = entities_->applyRemote(remote);
            break;
        case models::ResolutionStrategy::LocalWins:
            // Rebase on the remote copy so the next push is accepted.
            local.basePayload = remote.payload;
            local.dirty = true;
            local.conflicted = false;
            saved = entities_->save(local);
            break;
        case models::ResolutionStrategy::Merged:
            local.payload = conflict.mergedPayload;
            local.version = fsUtils::contentVersion(local.payload);
            local.basePayload = remote.payload;
            local.updatedAt = std::max(clock_(), local.updatedAt);
            local.dirty = true;
            local.deleted = false;
            local.conflicted = false;
            saved = entities_->save(local);
            break;
        case models::ResolutionStrategy::Unresolved:
            local.conflicted = true;
            saved = entities_->save(local);
            break;
        }
        if (!saved)
            throw errors::SyncError(errors::ErrorKind::Storage, "Failed to apply resolution to " + local.key());
    }

    models::SyncConflict SyncOrchestrator::resolveConflict(const std::string &conflict_id,
                                                           models::ResolutionStrategy strategy,
                                                           const std::optional<json> &merged_payload)
    {
        auto conflict = resolver_->resolveManually(conflict_id, strategy, merged_payload);

        models::EntityRecord remote;
        remote.entityType = conflict.entityType;
        remote.entityId = conflict.entityId;
        remote.version = conflict.remoteVersion;
        remote.updatedAt = conflict.remoteUpdatedAt;
        remote.payload = conflict.remotePayload;

        auto local = entities_->get(conflict.entityType, conflict.entityId);
        if (!local)
        {
            local = remote;
            local->version = conflict.localVersion;
            local->updatedAt = conflict.localUpdatedAt;
            local->payload = conflict.localPayload;
        }
        applyResolution(conflict, *local, remote);
        notifyLocalChange();
        return conflict;
    }

    void SyncOrchestrator::start()
    {
        if (started_.exchange(true))
        {
            MyLogger::debug("Sync >> orchestrator already started");
            return;
        }
        last_connected_ = network_->getCurrentState().connected;
        schedulePoll();
        if (token_ && !token_->empty() && !startup_done_.exchange(true))
            postSync(Source::Startup);
        MyLogger::info("Sync >> orchestrator started");
    }

    void SyncOrchestrator::stop()
    {
        if (!started_.exchange(false))
            return;
        poll_timer_.cancel();
        MyLogger::info("Sync >> orchestrator stopped");
    }

    void SyncOrchestrator::setAuthToken(const std::string &token)
    {
        token_->set(token);
        if (started_ && !token.empty() && !startup_done_.exchange(true))
            postSync(Source::Startup);
    }

    void SyncOrchestrator::notifyLocalChange()
    {
        if (!started_)
            return;
        if (local_change_posted_.exchange(true))
            return;
        boost::asio::post(io_, [this]
                          {
                              local_change_posted_ = false;
                              if (started_)
                                  sync(SyncRequest{Priority::High, Source::LocalChange}); });
    }

    std::optional<SyncReport> SyncOrchestrator::pollConnectivity()
    {
        const bool connected = network_->getCurrentState().connected;
        const bool was_connected = last_connected_;
        last_connected_ = connected;

        if (connected && !was_connected)
        {
            MyLogger::info("Sync >> network reconnected");
            return sync(SyncRequest{Priority::High, Source::Reconnect});
        }
        if (!connected && was_connected)
        {
            MyLogger::info("Sync >> network lost");
            std::lock_guard<std::mutex> lock(mutex_);
            if (!in_flight_)
                state_ = SyncState::Offline;
        }
        return std::nullopt;
    }

    SyncStatus SyncOrchestrator::currentStatus()
    {
        SyncStatus status;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status.status = state_;
            status.lastSyncAt = last_sync_at_;
            status.lastError = last_error_;
        }
        status.pendingCount = entities_->pendingCount() + uploader_->pendingUploads().size();
        return status;
    }

    void SyncOrchestrator::schedulePoll()
    {
        poll_timer_.expires_after(std::chrono::milliseconds(options_.connectivity_poll_ms));
        poll_timer_.async_wait([this](const boost::system::error_code &ec)
                               {
                                   if (ec == boost::asio::error::operation_aborted || !started_)
                                       return;
                                   pollConnectivity();
                                   if (started_)
                                       schedulePoll(); });
    }

    void SyncOrchestrator::postSync(Source source)
    {
        boost::asio::post(io_, [this, source]
                          {
                              if (started_)
                                  sync(SyncRequest{Priority::High, source}); });
    }
} // namespace sync_orchestrator
