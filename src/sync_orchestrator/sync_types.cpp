#include "sync_types.hpp"

namespace sync_orchestrator
{
    std::string toString(Priority priority)
    {
        return priority == Priority::Low ? "low" : "high";
    }

    std::string toString(Source source)
    {
        switch (source)
        {
        case Source::Periodic:
            return "periodic";
        case Source::Manual:
            return "manual";
        case Source::Reconnect:
            return "reconnect";
        case Source::Startup:
            return "startup";
        case Source::LocalChange:
            return "local_change";
        }
        return "unknown";
    }

    std::string toString(SyncState state)
    {
        switch (state)
        {
        case SyncState::Idle:
            return "idle";
        case SyncState::Syncing:
            return "syncing";
        case SyncState::Synced:
            return "synced";
        case SyncState::Error:
            return "error";
        case SyncState::Offline:
            return "offline";
        }
        return "unknown";
    }

    json SyncReport::toJson() const
    {
        return json{
            {"success", success},
            {"kind", errors::toString(kind)},
            {"error", error},
            {"retryable", retryable},
            {"coalesced", coalesced},
            {"uploaded", uploaded},
            {"downloaded", downloaded},
            {"conflicts", conflicts}};
    }

    json SyncStatus::toJson() const
    {
        json j{
            {"status", toString(status)},
            {"pendingCount", pendingCount}};
        j["lastSyncAt"] = lastSyncAt ? json(*lastSyncAt) : json();
        j["lastError"] = lastError ? json(*lastError) : json();
        return j;
    }
} // namespace sync_orchestrator
