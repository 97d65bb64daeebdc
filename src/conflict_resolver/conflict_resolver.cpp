#include "conflict_resolver.hpp"
#include <cstdlib>
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include "../merge/merge.hpp"

namespace conflict_resolver
{
    ConflictResolver::ConflictResolver(std::shared_ptr<local_store::LocalStore> store,
                                       clock_source::Clock clock,
                                       int64_t tolerance_ms)
        : store_(std::move(store)), clock_(std::move(clock)), tolerance_ms_(tolerance_ms) {}

    models::SyncConflict ConflictResolver::resolve(const std::string &entity_type,
                                                   const std::string &entity_id,
                                                   const models::EntityRecord &local,
                                                   const models::EntityRecord &remote,
                                                   const json &base)
    {
        const int64_t now = clock_();

        models::SyncConflict conflict;
        conflict.id = models::generateId("sc", now);
        conflict.entityType = entity_type;
        conflict.entityId = entity_id;
        conflict.localVersion = local.version;
        conflict.remoteVersion = remote.version;
        conflict.localUpdatedAt = local.updatedAt;
        conflict.remoteUpdatedAt = remote.updatedAt;
        conflict.localPayload = local.payload;
        conflict.remotePayload = remote.payload;
        conflict.detectedAt = now;

        const int64_t gap = std::llabs(local.updatedAt - remote.updatedAt);
        if (gap > tolerance_ms_)
        {
            conflict.resolutionStrategy = local.updatedAt > remote.updatedAt
                                              ? models::ResolutionStrategy::LocalWins
                                              : models::ResolutionStrategy::RemoteWins;
            conflict.resolvedAt = now;
        }
        else if (!base.is_null() && !local.deleted && !remote.deleted)
        {
            auto merged = merge::mergePayloads(base, local.payload, remote.payload);
            if (merged)
            {
                conflict.resolutionStrategy = models::ResolutionStrategy::Merged;
                conflict.mergedPayload = *merged;
                conflict.resolvedAt = now;
            }
        }

        MyLogger::info("Conflict >> " + entity_type + ":" + entity_id + " -> " +
                       models::toString(conflict.resolutionStrategy) +
                       " (gap " + std::to_string(gap) + " ms)");
        if (!persist(conflict))
            MyLogger::error("Conflict >> failed to record conflict " + conflict.id);
        return conflict;
    }

    std::optional<models::SyncConflict> ConflictResolver::get(const std::string &conflict_id)
    {
        auto record = store_->get(models::SYNC_CONFLICTS, conflict_id);
        if (!record)
            return std::nullopt;
        return record->get<models::SyncConflict>();
    }

    std::vector<models::SyncConflict> ConflictResolver::listUnresolved()
    {
        std::vector<models::SyncConflict> out;
        auto records = store_->queryOrdered(
            models::SYNC_CONFLICTS,
            [](const json &r)
            { return r.contains("resolvedAt") && r["resolvedAt"].is_null(); },
            local_store::OrderBy{"detectedAt", true});
        for (const auto &r : records)
            out.push_back(r.get<models::SyncConflict>());
        return out;
    }

    std::vector<models::SyncConflict> ConflictResolver::listAll()
    {
        std::vector<models::SyncConflict> out;
        for (const auto &r : store_->queryOrdered(models::SYNC_CONFLICTS, local_store::matchAll(),
                                                  local_store::OrderBy{"detectedAt", true}))
            out.push_back(r.get<models::SyncConflict>());
        return out;
    }

    models::SyncConflict ConflictResolver::resolveManually(const std::string &conflict_id,
                                                           models::ResolutionStrategy strategy,
                                                           const std::optional<json> &merged_payload)
    {
        auto conflict = get(conflict_id);
        if (!conflict)
            throw errors::SyncError(errors::ErrorKind::NotFound, "Unknown conflict: " + conflict_id);
        if (conflict->resolvedAt)
            throw errors::validationError("Conflict already resolved: " + conflict_id);
        if (strategy == models::ResolutionStrategy::Unresolved)
            throw errors::validationError("Manual resolution needs a concrete strategy");
        if (strategy == models::ResolutionStrategy::Merged && !merged_payload)
            throw errors::validationError("Merged resolution needs a merged payload");

        conflict->resolutionStrategy = strategy;
        if (strategy == models::ResolutionStrategy::Merged)
            conflict->mergedPayload = *merged_payload;
        conflict->resolvedAt = clock_();

        if (!persist(*conflict))
            throw errors::SyncError(errors::ErrorKind::Storage, "Failed to record resolution of " + conflict_id);
        MyLogger::info("Conflict >> " + conflict_id + " resolved manually: " + models::toString(strategy));
        return *conflict;
    }

    bool ConflictResolver::persist(const models::SyncConflict &conflict)
    {
        return store_->put(models::SYNC_CONFLICTS, conflict.id, json(conflict));
    }
} // namespace conflict_resolver
