#ifndef SYNC_ORCHESTRATOR_HPP
#define SYNC_ORCHESTRATOR_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <boost/asio.hpp>
#include "../auth/token_holder.hpp"
#include "../backoff/backoff.hpp"
#include "../chunked_upload/chunked_upload.hpp"
#include "../conflict_resolver/conflict_resolver.hpp"
#include "../entity_store/entity_store.hpp"
#include "../network/network_observer.hpp"
#include "../sync_api/sync_api.hpp"
#include "sync_types.hpp"

namespace sync_orchestrator
{
    struct OrchestratorOptions
    {
        int batch_size = 100;
        int64_t connectivity_poll_ms = 5000;
        // Extra attempts per push or pull batch on a transient failure.
        int request_retries = 3;
        backoff::Policy retry_backoff{500, 8000};
    };

    /**
     * Decides when a sync pass runs and carries it out: resume pending file
     * uploads, push dirty entities, pull remote changes since the last
     * cursor, and send every divergence through the conflict resolver.
     *
     * Passes never overlap. A caller arriving while a pass is running waits
     * for it and gets its report flagged as coalesced. A call made from
     * inside the running pass returns at once, also coalesced.
     *
     * Triggers are scheduled on the io_context given at construction:
     * startup (once a token is known), reconnect (connectivity polling),
     * local changes (notifyLocalChange) and the periodic trigger, which calls
     * sync() directly.
     */
    class SyncOrchestrator : public SyncRequester
    {
    public:
        SyncOrchestrator(boost::asio::io_context &io,
                         std::shared_ptr<network::NetworkObserver> network,
                         std::shared_ptr<chunked_upload::ChunkedUploader> uploader,
                         std::shared_ptr<entity_store::EntityStore> entities,
                         std::shared_ptr<conflict_resolver::ConflictResolver> resolver,
                         std::shared_ptr<sync_api::SyncApi> api,
                         std::shared_ptr<auth::TokenHolder> token,
                         clock_source::Clock clock,
                         OrchestratorOptions options = OrchestratorOptions());
        ~SyncOrchestrator() override;

        SyncReport sync(const SyncRequest &request) override;

        // Both idempotent. stop() cancels scheduled triggers; a running pass
        // is allowed to finish.
        void start();
        void stop();
        bool isStarted() const { return started_; }

        void setAuthToken(const std::string &token);

        // Posts one sync for any number of notifications made before it runs.
        void notifyLocalChange();

        // Samples the network observer; on a disconnected -> connected edge
        // runs a reconnect sync and returns its report.
        std::optional<SyncReport> pollConnectivity();

        SyncStatus currentStatus();

        // Settles an unresolved conflict and applies the chosen side to the
        // local entity.
        models::SyncConflict resolveConflict(const std::string &conflict_id,
                                             models::ResolutionStrategy strategy,
                                             const std::optional<json> &merged_payload = std::nullopt);

    private:
        SyncReport runPass(const SyncRequest &request);
        void resumeUploads(SyncReport &report);
        bool pushChanges(SyncReport &report);
        bool pullChanges(SyncReport &report);
        void handleConflict(const models::EntityRecord &local, const models::EntityRecord &remote, SyncReport &report);
        void applyResolution(const models::SyncConflict &conflict,
                             models::EntityRecord local,
                             const models::EntityRecord &remote);
        void recordFailure(SyncReport &report, errors::ErrorKind kind, const std::string &error);
        void schedulePoll();
        void postSync(Source source);

        boost::asio::io_context &io_;
        std::shared_ptr<network::NetworkObserver> network_;
        std::shared_ptr<chunked_upload::ChunkedUploader> uploader_;
        std::shared_ptr<entity_store::EntityStore> entities_;
        std::shared_ptr<conflict_resolver::ConflictResolver> resolver_;
        std::shared_ptr<sync_api::SyncApi> api_;
        std::shared_ptr<auth::TokenHolder> token_;
        clock_source::Clock clock_;
        OrchestratorOptions options_;

        boost::asio::steady_timer poll_timer_;
        std::atomic<bool> started_{false};
        std::atomic<bool> startup_done_{false};
        std::atomic<bool> local_change_posted_{false};
        bool last_connected_ = false;

        std::mutex mutex_;
        std::condition_variable cv_;
        bool in_flight_ = false;
        std::thread::id in_flight_thread_;
        uint64_t generation_ = 0;
        SyncReport last_report_;
        SyncState state_ = SyncState::Idle;
        std::optional<int64_t> last_sync_at_;
        std::optional<std::string> last_error_;
    };
} // namespace sync_orchestrator

#endif // SYNC_ORCHESTRATOR_HPP
