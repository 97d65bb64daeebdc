#ifndef CHUNKED_UPLOAD_HPP
#define CHUNKED_UPLOAD_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../errors/errors.hpp"
#include "../local_store/local_store.hpp"
#include "../models/models.hpp"
#include "../transport/transport.hpp"

namespace chunked_upload
{
    constexpr int64_t DEFAULT_CHUNK_SIZE = 5 * 1024 * 1024;

    struct ChunkPlan
    {
        int64_t totalChunks = 0;
        int64_t lastChunkSizeBytes = 0;
    };

    // Throws SyncError(Validation) if either size is not positive.
    ChunkPlan calculateChunks(int64_t file_size_bytes, int64_t chunk_size_bytes = DEFAULT_CHUNK_SIZE);

    struct UploadResult
    {
        bool success = false;
        errors::ErrorKind kind = errors::ErrorKind::None;
        std::string err;
        bool retryable = false;
        int64_t chunksSent = 0;
        int64_t lastChunkUploaded = -1;
    };

    using ProgressCallback = std::function<void(int64_t chunk_index, int64_t total_chunks)>;

    /**
     * Sequential chunked upload with progress persisted in upload_records.
     *
     * lastChunkUploaded is written after every acknowledged chunk and before
     * the next one is read, so a crash costs at most one chunk of re-send.
     * Calling uploadFile() again with the same uploadId resumes from
     * lastChunkUploaded + 1. A Failed record is terminal; retryFailed()
     * registers a fresh record for the same capture.
     */
    class ChunkedUploader
    {
    public:
        ChunkedUploader(std::shared_ptr<local_store::LocalStore> store,
                        std::shared_ptr<transport::Transport> transport,
                        clock_source::Clock clock,
                        int64_t chunk_size_bytes = DEFAULT_CHUNK_SIZE);

        // Persists an InProgress record without sending anything. Throws
        // SyncError(Validation) on bad input, if the id already failed, or
        // if the capture already has another upload in progress.
        models::UploadRecord registerUpload(const std::string &upload_id,
                                            const std::string &capture_id,
                                            const std::string &file_path,
                                            int64_t file_size_bytes);

        // Same validation as registerUpload. Transfer failures are reported
        // in the result; a Failed record returns its stored error unsent.
        UploadResult uploadFile(const std::string &upload_id,
                                const std::string &capture_id,
                                const std::string &file_path,
                                int64_t file_size_bytes,
                                const ProgressCallback &progress = nullptr);

        UploadResult resumeUpload(const std::string &upload_id,
                                  const std::string &capture_id,
                                  const std::string &file_path,
                                  int64_t file_size_bytes,
                                  const ProgressCallback &progress = nullptr);

        UploadResult resumeUpload(const models::UploadRecord &record,
                                  const ProgressCallback &progress = nullptr);

        // New InProgress record from the beginning of the file, or nullopt
        // if upload_id is not Failed. Throws SyncError(Validation) if the
        // capture already has an upload in progress.
        std::optional<models::UploadRecord> retryFailed(const std::string &upload_id);

        std::vector<models::UploadRecord> pendingUploads();
        // Newest record for the capture.
        std::optional<models::UploadRecord> findByCapture(const std::string &capture_id);
        std::optional<models::UploadRecord> getProgress(const std::string &upload_id);

    private:
        models::UploadRecord prepareRecord(const std::string &upload_id,
                                           const std::string &capture_id,
                                           const std::string &file_path,
                                           int64_t file_size_bytes);
        bool persist(models::UploadRecord &record);
        UploadResult fail(models::UploadRecord &record, errors::ErrorKind kind, const std::string &err);

        std::shared_ptr<local_store::LocalStore> store_;
        std::shared_ptr<transport::Transport> transport_;
        clock_source::Clock clock_;
        int64_t chunk_size_bytes_;
        std::mutex register_mutex_;
    };
} // namespace chunked_upload

#endif // CHUNKED_UPLOAD_HPP
