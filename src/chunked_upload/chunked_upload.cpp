#include "chunked_upload.hpp"
#include <algorithm>
#include "../fsUtils/fsUtils.hpp"
#include "../logger/Mylogger.hpp"

namespace chunked_upload
{
    ChunkPlan calculateChunks(int64_t file_size_bytes, int64_t chunk_size_bytes)
    {
        if (file_size_bytes <= 0)
            throw errors::validationError("File size must be positive, got " + std::to_string(file_size_bytes));
        if (chunk_size_bytes <= 0)
            throw errors::validationError("Chunk size must be positive, got " + std::to_string(chunk_size_bytes));

        ChunkPlan plan;
        plan.totalChunks = (file_size_bytes + chunk_size_bytes - 1) / chunk_size_bytes;
        int64_t remainder = file_size_bytes % chunk_size_bytes;
        plan.lastChunkSizeBytes = remainder == 0 ? chunk_size_bytes : remainder;
        return plan;
    }

    ChunkedUploader::ChunkedUploader(std::shared_ptr<local_store::LocalStore> store,
                                     std::shared_ptr<transport::Transport> transport,
                                     clock_source::Clock clock,
                                     int64_t chunk_size_bytes)
        : store_(std::move(store)), transport_(std::move(transport)), clock_(std::move(clock)),
          chunk_size_bytes_(chunk_size_bytes)
    {
        if (chunk_size_bytes_ <= 0)
            throw errors::validationError("Chunk size must be positive");
    }

    bool ChunkedUploader::persist(models::UploadRecord &record)
    {
        record.updatedAt = std::max(clock_(), record.updatedAt);
        return store_->put(models::UPLOAD_RECORDS, record.uploadId, json(record));
    }

    UploadResult ChunkedUploader::fail(models::UploadRecord &record, errors::ErrorKind kind, const std::string &err)
    {
        UploadResult result;
        result.kind = kind;
        result.err = err;
        result.retryable = errors::isRetryable(kind);
        result.lastChunkUploaded = record.lastChunkUploaded;

        record.lastError = err;
        if (!result.retryable)
            record.status = models::UploadStatus::Failed;
        if (!persist(record))
            MyLogger::error("Upload >> could not persist failure of " + record.uploadId);

        if (result.retryable)
            MyLogger::warning("Upload >> " + record.uploadId + " interrupted after chunk " +
                              std::to_string(record.lastChunkUploaded) + ": " + err);
        else
            MyLogger::error("Upload >> " + record.uploadId + " failed [" + errors::toString(kind) + "]: " + err);
        return result;
    }

    models::UploadRecord ChunkedUploader::prepareRecord(const std::string &upload_id,
                                                        const std::string &capture_id,
                                                        const std::string &file_path,
                                                        int64_t file_size_bytes)
    {
        if (upload_id.empty() || capture_id.empty() || file_path.empty())
            throw errors::validationError("uploadId, captureId and filePath are required");

        std::lock_guard<std::mutex> lock(register_mutex_);
        auto existing = store_->get(models::UPLOAD_RECORDS, upload_id);
        if (existing)
        {
            auto record = existing->get<models::UploadRecord>();
            if (record.captureId != capture_id || record.filePath != file_path ||
                record.fileSizeBytes != file_size_bytes)
                throw errors::validationError("Upload " + upload_id + " was registered for a different file");
            return record;
        }

        // The record keeps its own chunk size so a later config change
        // cannot shift chunk boundaries under a resumed upload.
        ChunkPlan plan = calculateChunks(file_size_bytes, chunk_size_bytes_);

        auto active = store_->queryOrdered(
            models::UPLOAD_RECORDS,
            [&capture_id](const json &r)
            {
                return r.value("captureId", std::string()) == capture_id &&
                       r.value("status", std::string()) == models::toString(models::UploadStatus::InProgress);
            });
        if (!active.empty())
            throw errors::validationError("Capture " + capture_id + " already has upload " +
                                          active.front().value("uploadId", std::string()) + " in progress");

        models::UploadRecord record;
        record.uploadId = upload_id;
        record.captureId = capture_id;
        record.filePath = file_path;
        record.fileSizeBytes = file_size_bytes;
        record.chunkSizeBytes = chunk_size_bytes_;
        record.totalChunks = plan.totalChunks;
        record.lastChunkUploaded = -1;
        record.status = models::UploadStatus::InProgress;
        record.createdAt = clock_();
        if (!persist(record))
            throw errors::SyncError(errors::ErrorKind::Storage, "Failed to persist upload record " + upload_id);

        MyLogger::info("Upload >> registered " + upload_id + " (" + std::to_string(plan.totalChunks) + " chunks)");
        return record;
    }

    models::UploadRecord ChunkedUploader::registerUpload(const std::string &upload_id,
                                                         const std::string &capture_id,
                                                         const std::string &file_path,
                                                         int64_t file_size_bytes)
    {
        auto record = prepareRecord(upload_id, capture_id, file_path, file_size_bytes);
        if (record.status == models::UploadStatus::Failed)
            throw errors::validationError("Upload " + upload_id + " already failed, use retryFailed");
        return record;
    }

    std::optional<models::UploadRecord> ChunkedUploader::retryFailed(const std::string &upload_id)
    {
        auto failed = getProgress(upload_id);
        if (!failed || failed->status != models::UploadStatus::Failed)
        {
            MyLogger::warning("Upload >> retryFailed: " + upload_id + " is not a failed upload");
            return std::nullopt;
        }
        auto record = prepareRecord(models::generateId("up_" + failed->captureId, clock_()),
                                    failed->captureId, failed->filePath, failed->fileSizeBytes);
        MyLogger::info("Upload >> " + upload_id + " retried as " + record.uploadId);
        return record;
    }

    UploadResult ChunkedUploader::uploadFile(const std::string &upload_id,
                                             const std::string &capture_id,
                                             const std::string &file_path,
                                             int64_t file_size_bytes,
                                             const ProgressCallback &progress)
    {
        models::UploadRecord record = prepareRecord(upload_id, capture_id, file_path, file_size_bytes);

        UploadResult result;
        result.lastChunkUploaded = record.lastChunkUploaded;
        if (record.status == models::UploadStatus::Completed)
        {
            result.success = true;
            return result;
        }
        if (record.status == models::UploadStatus::Failed)
        {
            // Failed is terminal. retryFailed() starts a new record.
            result.kind = errors::ErrorKind::PermanentResource;
            result.err = record.lastError.value_or("Upload failed");
            MyLogger::warning("Upload >> " + upload_id + " already failed, not resending");
            return result;
        }

        auto actualSize = fsUtils::regularFileSize(record.filePath);
        if (!actualSize)
            return fail(record, errors::ErrorKind::PermanentResource, "File not found: " + record.filePath);
        if (*actualSize != record.fileSizeBytes)
            return fail(record, errors::ErrorKind::PermanentResource,
                        "File size changed: expected " + std::to_string(record.fileSizeBytes) +
                            ", found " + std::to_string(*actualSize));

        ChunkPlan plan = calculateChunks(record.fileSizeBytes, record.chunkSizeBytes);
        std::string data;
        for (int64_t index = record.lastChunkUploaded + 1; index < plan.totalChunks; ++index)
        {
            const int64_t offset = index * record.chunkSizeBytes;
            const int64_t size = (index == plan.totalChunks - 1) ? plan.lastChunkSizeBytes : record.chunkSizeBytes;
            if (!fsUtils::readChunk(record.filePath, offset, size, data))
                return fail(record, errors::ErrorKind::PermanentResource,
                            "Short read of chunk " + std::to_string(index) + " from " + record.filePath);

            transport::ChunkResponse response = transport_->postChunk(record.uploadId, index, plan.totalChunks, data);
            if (!response.success || !response.chunkUploaded)
            {
                errors::ErrorKind kind = response.kind == errors::ErrorKind::None ? errors::ErrorKind::TransientIO
                                                                                 : response.kind;
                const int64_t sent = result.chunksSent;
                result = fail(record, kind, "Chunk " + std::to_string(index) + ": " + response.err);
                result.chunksSent = sent;
                return result;
            }
            if (response.nextOffset && *response.nextOffset != offset + size)
                MyLogger::warning("Upload >> server expects offset " + std::to_string(*response.nextOffset) +
                                  " after chunk " + std::to_string(index));

            record.lastChunkUploaded = index;
            record.lastError.reset();
            if (!persist(record))
            {
                UploadResult storageFailure;
                storageFailure.kind = errors::ErrorKind::Storage;
                storageFailure.err = "Failed to persist progress of " + record.uploadId;
                storageFailure.lastChunkUploaded = index - 1;
                storageFailure.chunksSent = result.chunksSent;
                MyLogger::error("Upload >> " + storageFailure.err);
                return storageFailure;
            }
            ++result.chunksSent;
            MyLogger::debug("Upload >> " + record.uploadId + " chunk " + std::to_string(index + 1) + "/" +
                            std::to_string(plan.totalChunks) + " acknowledged");
            if (progress)
                progress(index, plan.totalChunks);
        }

        record.status = models::UploadStatus::Completed;
        if (!persist(record))
        {
            result.kind = errors::ErrorKind::Storage;
            result.err = "Failed to persist completion of " + record.uploadId;
            result.lastChunkUploaded = record.lastChunkUploaded;
            MyLogger::error("Upload >> " + result.err);
            return result;
        }

        result.success = true;
        result.lastChunkUploaded = record.lastChunkUploaded;
        MyLogger::info("Upload >> " + record.uploadId + " completed");
        return result;
    }

    UploadResult ChunkedUploader::resumeUpload(const std::string &upload_id,
                                               const std::string &capture_id,
                                               const std::string &file_path,
                                               int64_t file_size_bytes,
                                               const ProgressCallback &progress)
    {
        return uploadFile(upload_id, capture_id, file_path, file_size_bytes, progress);
    }

    UploadResult ChunkedUploader::resumeUpload(const models::UploadRecord &record, const ProgressCallback &progress)
    {
        return uploadFile(record.uploadId, record.captureId, record.filePath, record.fileSizeBytes, progress);
    }

    std::vector<models::UploadRecord> ChunkedUploader::pendingUploads()
    {
        std::vector<models::UploadRecord> out;
        for (const auto &r : store_->queryOrdered(models::UPLOAD_RECORDS,
                                                  local_store::fieldEquals("status", models::toString(models::UploadStatus::InProgress)),
                                                  local_store::OrderBy{"createdAt", true}))
            out.push_back(r.get<models::UploadRecord>());
        return out;
    }

    std::optional<models::UploadRecord> ChunkedUploader::findByCapture(const std::string &capture_id)
    {
        auto records = store_->queryOrdered(models::UPLOAD_RECORDS,
                                            local_store::fieldEquals("captureId", capture_id),
                                            local_store::OrderBy{"createdAt", false});
        if (records.empty())
            return std::nullopt;
        return records.front().get<models::UploadRecord>();
    }

    std::optional<models::UploadRecord> ChunkedUploader::getProgress(const std::string &upload_id)
    {
        auto record = store_->get(models::UPLOAD_RECORDS, upload_id);
        if (!record)
            return std::nullopt;
        return record->get<models::UploadRecord>();
    }
} // namespace chunked_upload
