#ifndef CONFLICT_RESOLVER_HPP
#define CONFLICT_RESOLVER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../local_store/local_store.hpp"
#include "../models/models.hpp"

namespace conflict_resolver
{
    /**
     * Decides between diverged local and remote copies of one entity and
     * records the decision in the sync_conflicts collection.
     *
     * Updates further apart than the tolerance window are settled by
     * last-write-wins on updatedAt. Closer updates are three-way merged
     * against the base snapshot when one exists; if that fails the
     * conflict is left unresolved for manual review.
     *
     * Both versions are always kept on the conflict record.
     */
    class ConflictResolver
    {
    public:
        ConflictResolver(std::shared_ptr<local_store::LocalStore> store,
                         clock_source::Clock clock,
                         int64_t tolerance_ms);

        models::SyncConflict resolve(const std::string &entity_type,
                                     const std::string &entity_id,
                                     const models::EntityRecord &local,
                                     const models::EntityRecord &remote,
                                     const json &base = json());

        std::optional<models::SyncConflict> get(const std::string &conflict_id);
        std::vector<models::SyncConflict> listUnresolved();
        std::vector<models::SyncConflict> listAll();

        // Stamps resolvedAt on an unresolved conflict. Throws SyncError
        // (NotFound) for an unknown id and (Validation) when the conflict
        // is already resolved, the strategy is Unresolved, or Merged comes
        // without a payload.
        models::SyncConflict resolveManually(const std::string &conflict_id,
                                             models::ResolutionStrategy strategy,
                                             const std::optional<json> &merged_payload = std::nullopt);

        int64_t toleranceMs() const { return tolerance_ms_; }

    private:
        bool persist(const models::SyncConflict &conflict);

        std::shared_ptr<local_store::LocalStore> store_;
        clock_source::Clock clock_;
        int64_t tolerance_ms_;
    };
} // namespace conflict_resolver

#endif // CONFLICT_RESOLVER_HPP
