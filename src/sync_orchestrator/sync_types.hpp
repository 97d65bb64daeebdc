#ifndef SYNC_TYPES_HPP
#define SYNC_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "../errors/errors.hpp"
#include "../models/models.hpp"

namespace sync_orchestrator
{
    enum class Priority
    {
        Low,
        High
    };

    enum class Source
    {
        Periodic,
        Manual,
        Reconnect,
        Startup,
        LocalChange
    };

    std::string toString(Priority priority);
    std::string toString(Source source);

    struct SyncRequest
    {
        Priority priority = Priority::High;
        Source source = Source::Manual;
    };

    struct SyncReport
    {
        bool success = false;
        errors::ErrorKind kind = errors::ErrorKind::None;
        std::string error;
        bool retryable = false;
        bool coalesced = false; // joined or bounced off a pass already running

        int uploaded = 0;   // completed file uploads plus accepted entity pushes
        int downloaded = 0; // remote changes applied locally
        int conflicts = 0;

        // Offline is an expected outcome, not a failure.
        bool skipped() const { return kind == errors::ErrorKind::NetworkUnavailable; }

        json toJson() const;
    };

    // Anything that can be asked to run a sync pass.
    class SyncRequester
    {
    public:
        virtual ~SyncRequester() = default;
        virtual SyncReport sync(const SyncRequest &request) = 0;
    };

    enum class SyncState
    {
        Idle,
        Syncing,
        Synced,
        Error,
        Offline
    };

    std::string toString(SyncState state);

    struct SyncStatus
    {
        SyncState status = SyncState::Idle;
        size_t pendingCount = 0;
        std::optional<int64_t> lastSyncAt;
        std::optional<std::string> lastError;

        json toJson() const;
    };
} // namespace sync_orchestrator

#endif // SYNC_TYPES_HPP
