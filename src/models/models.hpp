#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace clock_source
{
    // Epoch milliseconds. Injected everywhere so tests can drive time.
    using Clock = std::function<int64_t()>;

    inline int64_t systemNowMs()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    inline Clock systemClock()
    {
        return &systemNowMs;
    }
} // namespace clock_source

namespace models
{
    // Collection names in the local store.
    constexpr const char *QUEUE_ITEMS = "queue_items";
    constexpr const char *UPLOAD_RECORDS = "upload_records";
    constexpr const char *SYNC_CONFLICTS = "sync_conflicts";
    constexpr const char *ENTITIES = "entities";
    constexpr const char *SYNC_STATE = "sync_state";

    enum class QueueStatus
    {
        Pending,
        Processing,
        Completed,
        Failed
    };

    enum class UploadStatus
    {
        InProgress,
        Completed,
        Failed
    };

    enum class ResolutionStrategy
    {
        LocalWins,
        RemoteWins,
        Merged,
        Unresolved
    };

    enum class NetworkTransport
    {
        None,
        Wifi,
        Cellular,
        Ethernet
    };

    std::string toString(QueueStatus status);
    std::string toString(UploadStatus status);
    std::string toString(ResolutionStrategy strategy);
    std::string toString(NetworkTransport transport);

    QueueStatus queueStatusFromString(const std::string &str);
    UploadStatus uploadStatusFromString(const std::string &str);
    ResolutionStrategy resolutionStrategyFromString(const std::string &str);

    struct QueueItem
    {
        std::string id;
        std::string captureId;
        std::string sourcePath;
        std::optional<double> sourceDuration;
        QueueStatus status = QueueStatus::Pending;
        int retryCount = 0;
        std::optional<std::string> lastError;
        int64_t createdAt = 0;
        int64_t updatedAt = 0;
        int64_t nextAttemptAt = 0; // backoff gate for re-enqueued items

        bool isTerminal() const
        {
            return status == QueueStatus::Completed || status == QueueStatus::Failed;
        }
    };

    struct UploadRecord
    {
        std::string uploadId;
        std::string captureId;
        std::string filePath;
        int64_t fileSizeBytes = 0;
        int64_t chunkSizeBytes = 0;
        int64_t totalChunks = 0;
        int64_t lastChunkUploaded = -1; // -1: nothing acknowledged yet
        UploadStatus status = UploadStatus::InProgress;
        std::optional<std::string> lastError;
        int64_t createdAt = 0;
        int64_t updatedAt = 0;
    };

    struct SyncConflict
    {
        std::string id;
        std::string entityType;
        std::string entityId;
        std::string localVersion;
        std::string remoteVersion;
        int64_t localUpdatedAt = 0;
        int64_t remoteUpdatedAt = 0;
        json localPayload;
        json remotePayload;
        json mergedPayload; // null unless strategy is Merged
        int64_t detectedAt = 0;
        std::optional<int64_t> resolvedAt;
        ResolutionStrategy resolutionStrategy = ResolutionStrategy::Unresolved;
    };

    // A syncable entity as cached on the device.
    struct EntityRecord
    {
        std::string entityType;
        std::string entityId;
        std::string version; // content hash of payload
        int64_t updatedAt = 0;
        json payload;
        json basePayload; // last state both sides agreed on
        bool dirty = false;
        bool deleted = false;
        bool conflicted = false;

        std::string key() const { return entityType + ":" + entityId; }
    };

    struct NetworkState
    {
        bool connected = false;
        NetworkTransport transport = NetworkTransport::None;
    };

    void to_json(json &j, const QueueItem &item);
    void from_json(const json &j, QueueItem &item);

    void to_json(json &j, const UploadRecord &record);
    void from_json(const json &j, UploadRecord &record);

    void to_json(json &j, const SyncConflict &conflict);
    void from_json(const json &j, SyncConflict &conflict);

    void to_json(json &j, const EntityRecord &entity);
    void from_json(const json &j, EntityRecord &entity);

    // Random identifier with a readable prefix, e.g. "tq_1718000000000_k3j9a2x".
    std::string generateId(const std::string &prefix, int64_t now_ms);
} // namespace models
