#include "sync_api.hpp"
#define CPPHTTPLIB_HEADER_ONLY
#include <httplib.h>
#include "../fsUtils/fsUtils.hpp"
#include "../logger/Mylogger.hpp"

namespace sync_api
{
    json changeToWire(const models::EntityRecord &entity)
    {
        json j;
        j["entityType"] = entity.entityType;
        j["entityId"] = entity.entityId;
        j["version"] = entity.version;
        j["baseVersion"] = entity.basePayload.is_null() ? "" : fsUtils::contentVersion(entity.basePayload);
        j["updatedAt"] = entity.updatedAt;
        j["payload"] = entity.payload;
        j["deleted"] = entity.deleted;
        return j;
    }

    models::EntityRecord changeFromWire(const json &j)
    {
        models::EntityRecord entity;
        entity.entityType = j.at("entityType").get<std::string>();
        entity.entityId = j.at("entityId").get<std::string>();
        entity.updatedAt = j.value("updatedAt", static_cast<int64_t>(0));
        entity.payload = j.value("payload", json());
        entity.deleted = j.value("deleted", false);
        entity.version = j.value("version", std::string());
        if (entity.version.empty())
            entity.version = fsUtils::contentVersion(entity.payload);
        return entity;
    }

    namespace
    {
        void configure(httplib::Client &cli, int64_t timeout_ms)
        {
            time_t sec = static_cast<time_t>(timeout_ms / 1000);
            time_t usec = static_cast<time_t>((timeout_ms % 1000) * 1000);
            cli.set_connection_timeout(sec, usec);
            cli.set_read_timeout(sec, usec);
            cli.set_write_timeout(sec, usec);
        }

        httplib::Headers authHeaders(const std::shared_ptr<auth::TokenHolder> &token)
        {
            httplib::Headers headers;
            if (token && !token->empty())
                headers.emplace("Authorization", "Bearer " + token->get());
            return headers;
        }

        // Fills kind/err from a missing or non-2xx response. Returns true if the
        // response can be parsed.
        template <typename Result>
        bool checkResponse(const httplib::Result &res, Result &out, const std::string &what)
        {
            if (!res)
            {
                out.kind = errors::ErrorKind::TransientIO;
                out.err = what + ": no response (httplib error " +
                          std::to_string(static_cast<int>(res.error())) + ")";
                return false;
            }
            out.kind = errors::classifyHttpStatus(res->status);
            if (out.kind != errors::ErrorKind::None)
            {
                out.err = what + ": HTTP " + std::to_string(res->status) + " " + res->body;
                return false;
            }
            return true;
        }
    }

    HttpSyncApi::HttpSyncApi(const std::string &base_url, int64_t timeout_ms, std::shared_ptr<auth::TokenHolder> token)
        : base_url_(base_url), timeout_ms_(timeout_ms), token_(std::move(token)) {}

    PushResult HttpSyncApi::push(const std::vector<models::EntityRecord> &changes)
    {
        PushResult result;
        json body;
        body["changes"] = json::array();
        for (const auto &entity : changes)
            body["changes"].push_back(changeToWire(entity));

        httplib::Client cli(base_url_);
        configure(cli, timeout_ms_);
        auto res = cli.Post("/api/sync/push", authHeaders(token_), body.dump(), "application/json");
        if (!checkResponse(res, result, "push"))
        {
            MyLogger::warning("SyncApi >> " + result.err);
            return result;
        }

        try
        {
            json response = json::parse(res->body);
            for (const auto &key : response.value("accepted", json::array()))
                result.accepted.push_back(key.get<std::string>());
            for (const auto &c : response.value("conflicts", json::array()))
                result.conflicts.push_back(changeFromWire(c));
            result.success = true;
        }
        catch (const json::exception &e)
        {
            result.kind = errors::ErrorKind::TransientIO;
            result.err = std::string("push: malformed response: ") + e.what();
            MyLogger::warning("SyncApi >> " + result.err);
        }
        return result;
    }

    PullResult HttpSyncApi::pull(int64_t since, int limit)
    {
        PullResult result;
        httplib::Client cli(base_url_);
        configure(cli, timeout_ms_);
        const std::string path = "/api/sync/pull?since=" + std::to_string(since) + "&limit=" + std::to_string(limit);
        auto res = cli.Get(path.c_str(), authHeaders(token_));
        if (!checkResponse(res, result, "pull"))
        {
            MyLogger::warning("SyncApi >> " + result.err);
            return result;
        }

        try
        {
            json response = json::parse(res->body);
            for (const auto &c : response.value("changes", json::array()))
                result.changes.push_back(changeFromWire(c));
            result.serverTime = response.value("serverTime", since);
            result.hasMore = response.value("hasMore", false);
            result.success = true;
        }
        catch (const json::exception &e)
        {
            result.kind = errors::ErrorKind::TransientIO;
            result.err = std::string("pull: malformed response: ") + e.what();
            MyLogger::warning("SyncApi >> " + result.err);
        }
        return result;
    }
} // namespace sync_api
