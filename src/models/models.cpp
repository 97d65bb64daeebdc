#include "models.hpp"

#include <random>

namespace models
{
    namespace
    {
        template <typename T>
        void putOptional(json &j, const char *key, const std::optional<T> &value)
        {
            if (value)
                j[key] = *value;
            else
                j[key] = nullptr;
        }

        template <typename T>
        std::optional<T> getOptional(const json &j, const char *key)
        {
            if (!j.contains(key) || j.at(key).is_null())
                return std::nullopt;
            return j.at(key).get<T>();
        }

        json valueOrNull(const json &j, const char *key)
        {
            return j.contains(key) ? j.at(key) : json();
        }
    }

    std::string toString(QueueStatus status)
    {
        switch (status)
        {
        case QueueStatus::Pending:
            return "pending";
        case QueueStatus::Processing:
            return "processing";
        case QueueStatus::Completed:
            return "completed";
        case QueueStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    std::string toString(UploadStatus status)
    {
        switch (status)
        {
        case UploadStatus::InProgress:
            return "in_progress";
        case UploadStatus::Completed:
            return "completed";
        case UploadStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    std::string toString(ResolutionStrategy strategy)
    {
        switch (strategy)
        {
        case ResolutionStrategy::LocalWins:
            return "local_wins";
        case ResolutionStrategy::RemoteWins:
            return "remote_wins";
        case ResolutionStrategy::Merged:
            return "merged";
        case ResolutionStrategy::Unresolved:
            return "unresolved";
        }
        return "unknown";
    }

    std::string toString(NetworkTransport transport)
    {
        switch (transport)
        {
        case NetworkTransport::None:
            return "none";
        case NetworkTransport::Wifi:
            return "wifi";
        case NetworkTransport::Cellular:
            return "cellular";
        case NetworkTransport::Ethernet:
            return "ethernet";
        }
        return "unknown";
    }

    QueueStatus queueStatusFromString(const std::string &str)
    {
        if (str == "processing")
            return QueueStatus::Processing;
        if (str == "completed")
            return QueueStatus::Completed;
        if (str == "failed")
            return QueueStatus::Failed;
        return QueueStatus::Pending;
    }

    UploadStatus uploadStatusFromString(const std::string &str)
    {
        if (str == "completed")
            return UploadStatus::Completed;
        if (str == "failed")
            return UploadStatus::Failed;
        return UploadStatus::InProgress;
    }

    ResolutionStrategy resolutionStrategyFromString(const std::string &str)
    {
        if (str == "local_wins")
            return ResolutionStrategy::LocalWins;
        if (str == "remote_wins")
            return ResolutionStrategy::RemoteWins;
        if (str == "merged")
            return ResolutionStrategy::Merged;
        return ResolutionStrategy::Unresolved;
    }

    // ------------------------------
    // QueueItem
    // ------------------------------

    void to_json(json &j, const QueueItem &item)
    {
        j = json{
            {"id", item.id},
            {"captureId", item.captureId},
            {"sourcePath", item.sourcePath},
            {"status", toString(item.status)},
            {"retryCount", item.retryCount},
            {"createdAt", item.createdAt},
            {"updatedAt", item.updatedAt},
            {"nextAttemptAt", item.nextAttemptAt}};
        putOptional(j, "sourceDuration", item.sourceDuration);
        putOptional(j, "lastError", item.lastError);
    }

    void from_json(const json &j, QueueItem &item)
    {
        j.at("id").get_to(item.id);
        j.at("captureId").get_to(item.captureId);
        j.at("sourcePath").get_to(item.sourcePath);
        item.status = queueStatusFromString(j.at("status").get<std::string>());
        j.at("retryCount").get_to(item.retryCount);
        j.at("createdAt").get_to(item.createdAt);
        j.at("updatedAt").get_to(item.updatedAt);
        item.nextAttemptAt = j.value("nextAttemptAt", int64_t(0));
        item.sourceDuration = getOptional<double>(j, "sourceDuration");
        item.lastError = getOptional<std::string>(j, "lastError");
    }

    // ------------------------------
    // UploadRecord
    // ------------------------------

    void to_json(json &j, const UploadRecord &record)
    {
        j = json{
            {"uploadId", record.uploadId},
            {"captureId", record.captureId},
            {"filePath", record.filePath},
            {"fileSizeBytes", record.fileSizeBytes},
            {"chunkSizeBytes", record.chunkSizeBytes},
            {"totalChunks", record.totalChunks},
            {"lastChunkUploaded", record.lastChunkUploaded},
            {"status", toString(record.status)},
            {"createdAt", record.createdAt},
            {"updatedAt", record.updatedAt}};
        putOptional(j, "lastError", record.lastError);
    }

    void from_json(const json &j, UploadRecord &record)
    {
        j.at("uploadId").get_to(record.uploadId);
        j.at("captureId").get_to(record.captureId);
        j.at("filePath").get_to(record.filePath);
        j.at("fileSizeBytes").get_to(record.fileSizeBytes);
        j.at("chunkSizeBytes").get_to(record.chunkSizeBytes);
        j.at("totalChunks").get_to(record.totalChunks);
        j.at("lastChunkUploaded").get_to(record.lastChunkUploaded);
        record.status = uploadStatusFromString(j.at("status").get<std::string>());
        record.createdAt = j.value("createdAt", int64_t(0));
        record.updatedAt = j.value("updatedAt", int64_t(0));
        record.lastError = getOptional<std::string>(j, "lastError");
    }

    // ------------------------------
    // SyncConflict
    // ------------------------------

    void to_json(json &j, const SyncConflict &conflict)
    {
        j = json{
            {"id", conflict.id},
            {"entityType", conflict.entityType},
            {"entityId", conflict.entityId},
            {"localVersion", conflict.localVersion},
            {"remoteVersion", conflict.remoteVersion},
            {"localUpdatedAt", conflict.localUpdatedAt},
            {"remoteUpdatedAt", conflict.remoteUpdatedAt},
            {"localPayload", conflict.localPayload},
            {"remotePayload", conflict.remotePayload},
            {"mergedPayload", conflict.mergedPayload},
            {"detectedAt", conflict.detectedAt},
            {"resolutionStrategy", toString(conflict.resolutionStrategy)}};
        putOptional(j, "resolvedAt", conflict.resolvedAt);
    }

    void from_json(const json &j, SyncConflict &conflict)
    {
        j.at("id").get_to(conflict.id);
        j.at("entityType").get_to(conflict.entityType);
        j.at("entityId").get_to(conflict.entityId);
        j.at("localVersion").get_to(conflict.localVersion);
        j.at("remoteVersion").get_to(conflict.remoteVersion);
        conflict.localUpdatedAt = j.value("localUpdatedAt", int64_t(0));
        conflict.remoteUpdatedAt = j.value("remoteUpdatedAt", int64_t(0));
        conflict.localPayload = valueOrNull(j, "localPayload");
        conflict.remotePayload = valueOrNull(j, "remotePayload");
        conflict.mergedPayload = valueOrNull(j, "mergedPayload");
        j.at("detectedAt").get_to(conflict.detectedAt);
        conflict.resolvedAt = getOptional<int64_t>(j, "resolvedAt");
        conflict.resolutionStrategy =
            resolutionStrategyFromString(j.at("resolutionStrategy").get<std::string>());
    }

    // ------------------------------
    // EntityRecord
    // ------------------------------

    void to_json(json &j, const EntityRecord &entity)
    {
        j = json{
            {"entityType", entity.entityType},
            {"entityId", entity.entityId},
            {"version", entity.version},
            {"updatedAt", entity.updatedAt},
            {"payload", entity.payload},
            {"basePayload", entity.basePayload},
            {"dirty", entity.dirty},
            {"deleted", entity.deleted},
            {"conflicted", entity.conflicted}};
    }

    void from_json(const json &j, EntityRecord &entity)
    {
        j.at("entityType").get_to(entity.entityType);
        j.at("entityId").get_to(entity.entityId);
        entity.version = j.value("version", std::string());
        entity.updatedAt = j.value("updatedAt", int64_t(0));
        entity.payload = valueOrNull(j, "payload");
        entity.basePayload = valueOrNull(j, "basePayload");
        entity.dirty = j.value("dirty", false);
        entity.deleted = j.value("deleted", false);
        entity.conflicted = j.value("conflicted", false);
    }

    std::string generateId(const std::string &prefix, int64_t now_ms)
    {
        static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet) - 2);

        std::string suffix;
        for (int i = 0; i < 7; ++i)
            suffix.push_back(alphabet[dist(gen)]);
        return prefix + "_" + std::to_string(now_ms) + "_" + suffix;
    }
} // namespace models
