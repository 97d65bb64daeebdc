#include "entity_store.hpp"
#include "../errors/errors.hpp"
#include "../fsUtils/fsUtils.hpp"
#include "../logger/Mylogger.hpp"

namespace entity_store
{
    namespace
    {
        const char *LAST_PULLED_AT = "lastPulledAt";

        std::string entityKey(const std::string &entity_type, const std::string &entity_id)
        {
            return entity_type + ":" + entity_id;
        }
    }

    EntityStore::EntityStore(std::shared_ptr<local_store::LocalStore> store, clock_source::Clock clock)
        : store_(std::move(store)), clock_(std::move(clock)) {}

    models::EntityRecord EntityStore::upsertLocal(const std::string &entity_type,
                                                  const std::string &entity_id,
                                                  const json &payload)
    {
        if (entity_type.empty() || entity_id.empty())
            throw errors::validationError("Entity type and id are required");

        models::EntityRecord entity;
        auto existing = get(entity_type, entity_id);
        if (existing)
            entity = *existing;
        entity.entityType = entity_type;
        entity.entityId = entity_id;
        entity.payload = payload;
        entity.version = fsUtils::contentVersion(payload);
        entity.updatedAt = clock_();
        entity.deleted = false;
        entity.dirty = true;

        if (!save(entity))
            throw errors::SyncError(errors::ErrorKind::Storage, "Failed to save entity " + entity.key());
        MyLogger::debug("Entities >> local change " + entity.key());
        return entity;
    }

    bool EntityStore::markDeleted(const std::string &entity_type, const std::string &entity_id)
    {
        auto entity = get(entity_type, entity_id);
        if (!entity)
            return false;
        entity->deleted = true;
        entity->dirty = true;
        entity->updatedAt = clock_();
        return save(*entity);
    }

    std::optional<models::EntityRecord> EntityStore::get(const std::string &entity_type, const std::string &entity_id)
    {
        auto record = store_->get(models::ENTITIES, entityKey(entity_type, entity_id));
        if (!record)
            return std::nullopt;
        return record->get<models::EntityRecord>();
    }

    bool EntityStore::save(const models::EntityRecord &entity)
    {
        return store_->put(models::ENTITIES, entity.key(), json(entity));
    }

    std::vector<models::EntityRecord> EntityStore::pendingPush(size_t limit)
    {
        auto records = store_->queryOrdered(
            models::ENTITIES,
            [](const json &r)
            { return r.value("dirty", false) && !r.value("conflicted", false); },
            local_store::OrderBy{"updatedAt", true});

        std::vector<models::EntityRecord> out;
        for (const auto &r : records)
        {
            if (limit > 0 && out.size() >= limit)
                break;
            out.push_back(r.get<models::EntityRecord>());
        }
        return out;
    }

    size_t EntityStore::pendingCount()
    {
        return pendingPush().size();
    }

    bool EntityStore::markPushed(const models::EntityRecord &pushed)
    {
        auto current = get(pushed.entityType, pushed.entityId);
        if (!current)
            return false;

        current->basePayload = pushed.payload;
        if (current->version == pushed.version && current->deleted == pushed.deleted)
            current->dirty = false;
        return save(*current);
    }

    bool EntityStore::applyRemote(const models::EntityRecord &remote)
    {
        models::EntityRecord entity = remote;
        entity.basePayload = remote.payload;
        entity.dirty = false;
        entity.conflicted = false;
        if (entity.version.empty())
            entity.version = fsUtils::contentVersion(entity.payload);
        return save(entity);
    }

    int64_t EntityStore::lastPulledAt()
    {
        auto record = store_->get(models::SYNC_STATE, LAST_PULLED_AT);
        if (!record)
            return 0;
        return record->value("value", static_cast<int64_t>(0));
    }

    bool EntityStore::setLastPulledAt(int64_t ts)
    {
        return store_->put(models::SYNC_STATE, LAST_PULLED_AT, json{{"value", ts}});
    }
} // namespace entity_store
