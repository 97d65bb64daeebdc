#ifndef PROCESSING_QUEUE_HPP
#define PROCESSING_QUEUE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../backoff/backoff.hpp"
#include "../errors/errors.hpp"
#include "../local_store/local_store.hpp"
#include "../models/models.hpp"
#include "../processor/capture_processor.hpp"

namespace processing_queue
{
    struct QueueOptions
    {
        int max_retries = 3;
        backoff::Policy backoff;
    };

    struct QueueStats
    {
        size_t pending = 0;
        size_t processing = 0;
        size_t completed = 0;
        size_t failed = 0;

        json toJson() const;
    };

    /**
     * FIFO queue of captures awaiting local processing, persisted in the
     * queue_items collection.
     *
     * At most one item is Processing at any time and each capture has at
     * most one non-terminal item. dequeueNext() hands out nothing until
     * openForProcessing() is called, which happens after crash recovery.
     */
    class ProcessingQueue
    {
    public:
        ProcessingQueue(std::shared_ptr<local_store::LocalStore> store,
                        clock_source::Clock clock,
                        QueueOptions options = QueueOptions());

        // Throws SyncError(Validation) on empty ids or when the capture
        // already has a Pending or Processing item.
        models::QueueItem enqueue(const std::string &capture_id,
                                  const std::string &source_path,
                                  std::optional<double> source_duration = std::nullopt);

        std::optional<models::QueueItem> dequeueNext();

        bool markCompleted(const std::string &id);

        // Transient kinds are retried with backoff until max_retries; any
        // other kind fails the item for good. Returns the updated item, or
        // nullopt if id is unknown or not Processing.
        std::optional<models::QueueItem> markFailed(const std::string &id,
                                                    const std::string &error,
                                                    errors::ErrorKind kind = errors::ErrorKind::TransientIO);

        void pause();
        void resume();
        bool isPaused();

        void openForProcessing();
        bool isOpen() const;

        std::optional<models::QueueItem> get(const std::string &id);
        // Most recent item for the capture.
        std::optional<models::QueueItem> findByCapture(const std::string &capture_id);
        std::vector<models::QueueItem> list(std::optional<models::QueueStatus> status = std::nullopt);
        QueueStats stats();

        // Only terminal items can be purged.
        bool purge(const std::string &id);
        size_t purgeCompleted();

        // Manual retry of a Failed item: the failed record stays as it is and
        // a fresh Pending item is queued for the same capture.
        std::optional<models::QueueItem> requeueFailed(const std::string &id);

        // Persists an item as-is. Used by crash recovery.
        bool save(const models::QueueItem &item);

    private:
        models::QueueItem enqueueLocked(const std::string &capture_id,
                                        const std::string &source_path,
                                        std::optional<double> source_duration);
        std::optional<models::QueueItem> getLocked(const std::string &id);
        std::optional<models::QueueItem> findActive(const std::string &capture_id);
        int64_t nextCreatedAt();

        std::shared_ptr<local_store::LocalStore> store_;
        clock_source::Clock clock_;
        QueueOptions options_;

        std::mutex mutex_;
        std::atomic<bool> open_{false};
        bool paused_ = false;
        int64_t last_created_at_ = 0;
    };

    // Runs queued items through the capture processor one at a time.
    class QueueWorker
    {
    public:
        using CompletionHandler = std::function<void(const models::QueueItem &)>;

        QueueWorker(ProcessingQueue &queue, processor::CaptureProcessor &processor);

        // Called after an item was marked Completed.
        void setOnCompleted(CompletionHandler handler) { on_completed_ = std::move(handler); }

        // Processes one item. Returns false if there was nothing to do.
        bool processNext();

        // Processes until the queue has no ready item. Returns the number run.
        size_t drain();

    private:
        ProcessingQueue &queue_;
        processor::CaptureProcessor &processor_;
        CompletionHandler on_completed_;
    };
} // namespace processing_queue

#endif // PROCESSING_QUEUE_HPP
