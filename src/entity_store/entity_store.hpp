#ifndef ENTITY_STORE_HPP
#define ENTITY_STORE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../local_store/local_store.hpp"
#include "../models/models.hpp"

namespace entity_store
{
    // Locally cached syncable entities plus the pull cursor. Every mutation
    // reads the freshest record and writes it back as one upsert.
    class EntityStore
    {
    public:
        EntityStore(std::shared_ptr<local_store::LocalStore> store, clock_source::Clock clock);

        // Local edit by the app: new payload, fresh version, marked dirty.
        models::EntityRecord upsertLocal(const std::string &entity_type,
                                         const std::string &entity_id,
                                         const json &payload);
        bool markDeleted(const std::string &entity_type, const std::string &entity_id);

        std::optional<models::EntityRecord> get(const std::string &entity_type, const std::string &entity_id);
        bool save(const models::EntityRecord &entity);

        // Dirty and not waiting on manual conflict resolution, oldest edit first.
        std::vector<models::EntityRecord> pendingPush(size_t limit = 0);
        size_t pendingCount();

        // Server accepted the pushed state. If the entity was edited again in
        // the meantime it stays dirty, only its base moves forward.
        bool markPushed(const models::EntityRecord &pushed);

        // Remote state becomes the local state and the new base.
        bool applyRemote(const models::EntityRecord &remote);

        int64_t lastPulledAt();
        bool setLastPulledAt(int64_t ts);

    private:
        std::shared_ptr<local_store::LocalStore> store_;
        clock_source::Clock clock_;
    };
} // namespace entity_store

#endif // ENTITY_STORE_HPP
