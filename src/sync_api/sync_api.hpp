#ifndef SYNC_API_HPP
#define SYNC_API_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../auth/token_holder.hpp"
#include "../errors/errors.hpp"
#include "../models/models.hpp"

namespace sync_api
{
    struct PushResult
    {
        bool success = false;
        errors::ErrorKind kind = errors::ErrorKind::None;
        std::string err;
        std::vector<std::string> accepted;          // EntityRecord::key() of accepted changes
        std::vector<models::EntityRecord> conflicts; // server's current copy of rejected entities
    };

    struct PullResult
    {
        bool success = false;
        errors::ErrorKind kind = errors::ErrorKind::None;
        std::string err;
        std::vector<models::EntityRecord> changes;
        int64_t serverTime = 0;
        bool hasMore = false;
    };

    // Entity-level push/pull against the remote server.
    class SyncApi
    {
    public:
        virtual ~SyncApi() = default;
        virtual PushResult push(const std::vector<models::EntityRecord> &changes) = 0;
        virtual PullResult pull(int64_t since, int limit) = 0;
    };

    // Wire shape of one entity change. The base version lets the server
    // detect that it moved on since our last pull.
    json changeToWire(const models::EntityRecord &entity);
    models::EntityRecord changeFromWire(const json &j);

    // POST <base>/api/sync/push  {"changes": [...]}
    //   -> {"accepted": ["type:id", ...], "conflicts": [change, ...]}
    // GET  <base>/api/sync/pull?since=<ms>&limit=<n>
    //   -> {"changes": [...], "serverTime": <ms>, "hasMore": bool}
    class HttpSyncApi : public SyncApi
    {
    public:
        HttpSyncApi(const std::string &base_url, int64_t timeout_ms, std::shared_ptr<auth::TokenHolder> token);

        PushResult push(const std::vector<models::EntityRecord> &changes) override;
        PullResult pull(int64_t since, int limit) override;

    private:
        std::string base_url_;
        int64_t timeout_ms_;
        std::shared_ptr<auth::TokenHolder> token_;
    };
} // namespace sync_api

#endif // SYNC_API_HPP
