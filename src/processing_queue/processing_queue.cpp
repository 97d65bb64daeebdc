#include "processing_queue.hpp"
#include <algorithm>
#include "../logger/Mylogger.hpp"

namespace processing_queue
{
    namespace
    {
        const char *PAUSED_KEY = "queuePaused";

        local_store::Filter statusIs(models::QueueStatus status)
        {
            return local_store::fieldEquals("status", models::toString(status));
        }
    }

    json QueueStats::toJson() const
    {
        return json{
            {"pending", pending},
            {"processing", processing},
            {"completed", completed},
            {"failed", failed}};
    }

    ProcessingQueue::ProcessingQueue(std::shared_ptr<local_store::LocalStore> store,
                                     clock_source::Clock clock,
                                     QueueOptions options)
        : store_(std::move(store)), clock_(std::move(clock)), options_(options)
    {
        auto newest = store_->queryOrdered(models::QUEUE_ITEMS, local_store::matchAll(),
                                           local_store::OrderBy{"createdAt", false});
        if (!newest.empty())
            last_created_at_ = newest.front().value("createdAt", static_cast<int64_t>(0));

        auto paused = store_->get(models::SYNC_STATE, PAUSED_KEY);
        paused_ = paused && paused->value("value", false);
    }

    int64_t ProcessingQueue::nextCreatedAt()
    {
        // Strictly increasing so FIFO order survives two enqueues in the same ms.
        last_created_at_ = std::max(clock_(), last_created_at_ + 1);
        return last_created_at_;
    }

    std::optional<models::QueueItem> ProcessingQueue::getLocked(const std::string &id)
    {
        auto record = store_->get(models::QUEUE_ITEMS, id);
        if (!record)
            return std::nullopt;
        return record->get<models::QueueItem>();
    }

    std::optional<models::QueueItem> ProcessingQueue::findActive(const std::string &capture_id)
    {
        auto records = store_->queryOrdered(
            models::QUEUE_ITEMS,
            [&capture_id](const json &r)
            {
                if (r.value("captureId", std::string()) != capture_id)
                    return false;
                const std::string status = r.value("status", std::string());
                return status == models::toString(models::QueueStatus::Pending) ||
                       status == models::toString(models::QueueStatus::Processing);
            });
        if (records.empty())
            return std::nullopt;
        return records.front().get<models::QueueItem>();
    }

    models::QueueItem ProcessingQueue::enqueue(const std::string &capture_id,
                                               const std::string &source_path,
                                               std::optional<double> source_duration)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return enqueueLocked(capture_id, source_path, source_duration);
    }

    models::QueueItem ProcessingQueue::enqueueLocked(const std::string &capture_id,
                                                     const std::string &source_path,
                                                     std::optional<double> source_duration)
    {
        if (capture_id.empty())
            throw errors::validationError("captureId is required");
        if (source_path.empty())
            throw errors::validationError("sourcePath is required");
        if (source_duration && *source_duration < 0)
            throw errors::validationError("sourceDuration must not be negative");

        auto active = findActive(capture_id);
        if (active)
            throw errors::validationError("Capture " + capture_id + " already queued as " + active->id +
                                          " (" + models::toString(active->status) + ")");

        models::QueueItem item;
        item.createdAt = nextCreatedAt();
        item.updatedAt = item.createdAt;
        item.id = models::generateId("tq", item.createdAt);
        item.captureId = capture_id;
        item.sourcePath = source_path;
        item.sourceDuration = source_duration;
        item.status = models::QueueStatus::Pending;

        if (!store_->put(models::QUEUE_ITEMS, item.id, json(item)))
            throw errors::SyncError(errors::ErrorKind::Storage, "Failed to persist queue item for " + capture_id);

        MyLogger::info("Queue >> enqueued " + item.id + " for capture " + capture_id);
        return item;
    }

    std::optional<models::QueueItem> ProcessingQueue::dequeueNext()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_)
        {
            MyLogger::debug("Queue >> not open yet, recovery pending");
            return std::nullopt;
        }
        if (paused_)
            return std::nullopt;

        auto processing = store_->queryOrdered(models::QUEUE_ITEMS, statusIs(models::QueueStatus::Processing));
        if (!processing.empty())
            return std::nullopt;

        const int64_t now = clock_();
        auto pending = store_->queryOrdered(models::QUEUE_ITEMS, statusIs(models::QueueStatus::Pending),
                                            local_store::OrderBy{"createdAt", true});
        for (const auto &record : pending)
        {
            auto item = record.get<models::QueueItem>();
            if (item.nextAttemptAt > now)
                continue;

            item.status = models::QueueStatus::Processing;
            item.updatedAt = std::max(now, item.updatedAt);
            if (!store_->put(models::QUEUE_ITEMS, item.id, json(item)))
            {
                MyLogger::error("Queue >> failed to mark " + item.id + " as processing");
                return std::nullopt;
            }
            MyLogger::info("Queue >> dequeued " + item.id + " (capture " + item.captureId + ")");
            return item;
        }
        return std::nullopt;
    }

    bool ProcessingQueue::markCompleted(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto item = getLocked(id);
        if (!item)
        {
            MyLogger::warning("Queue >> markCompleted: unknown item " + id);
            return false;
        }
        if (item->status != models::QueueStatus::Processing)
        {
            MyLogger::warning("Queue >> markCompleted: " + id + " is " + models::toString(item->status));
            return false;
        }

        item->status = models::QueueStatus::Completed;
        item->lastError.reset();
        item->updatedAt = std::max(clock_(), item->updatedAt);
        if (!store_->put(models::QUEUE_ITEMS, id, json(*item)))
        {
            MyLogger::error("Queue >> failed to persist completion of " + id);
            return false;
        }
        MyLogger::info("Queue >> completed " + id);
        return true;
    }

    std::optional<models::QueueItem> ProcessingQueue::markFailed(const std::string &id,
                                                                 const std::string &error,
                                                                 errors::ErrorKind kind)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto item = getLocked(id);
        if (!item || item->status != models::QueueStatus::Processing)
        {
            MyLogger::warning("Queue >> markFailed: " + id + " is not processing");
            return std::nullopt;
        }

        const int64_t now = std::max(clock_(), item->updatedAt);
        item->retryCount += 1;
        item->lastError = error;
        item->updatedAt = now;

        if (errors::isRetryable(kind) && item->retryCount < options_.max_retries)
        {
            const int64_t delay = backoff::exponentialDelay(item->retryCount, options_.backoff);
            item->status = models::QueueStatus::Pending;
            item->nextAttemptAt = now + delay;
            MyLogger::warning("Queue >> " + id + " failed (" + error + "), retry " +
                              std::to_string(item->retryCount) + "/" + std::to_string(options_.max_retries) +
                              " in " + std::to_string(delay) + " ms");
        }
        else
        {
            item->status = models::QueueStatus::Failed;
            MyLogger::error("Queue >> " + id + " failed permanently [" + errors::toString(kind) + "]: " + error);
        }

        if (!store_->put(models::QUEUE_ITEMS, id, json(*item)))
        {
            MyLogger::error("Queue >> failed to persist failure of " + id);
            return std::nullopt;
        }
        return item;
    }

    void ProcessingQueue::pause()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = true;
        if (!store_->put(models::SYNC_STATE, PAUSED_KEY, json{{"value", true}}))
            MyLogger::error("Queue >> failed to persist pause flag");
        MyLogger::info("Queue >> paused");
    }

    void ProcessingQueue::resume()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
        if (!store_->put(models::SYNC_STATE, PAUSED_KEY, json{{"value", false}}))
            MyLogger::error("Queue >> failed to persist pause flag");
        MyLogger::info("Queue >> resumed");
    }

    bool ProcessingQueue::isPaused()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return paused_;
    }

    void ProcessingQueue::openForProcessing()
    {
        open_ = true;
        MyLogger::info("Queue >> open for processing");
    }

    bool ProcessingQueue::isOpen() const
    {
        return open_;
    }

    std::optional<models::QueueItem> ProcessingQueue::get(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return getLocked(id);
    }

    std::optional<models::QueueItem> ProcessingQueue::findByCapture(const std::string &capture_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto records = store_->queryOrdered(models::QUEUE_ITEMS,
                                            local_store::fieldEquals("captureId", capture_id),
                                            local_store::OrderBy{"createdAt", false});
        if (records.empty())
            return std::nullopt;
        return records.front().get<models::QueueItem>();
    }

    std::vector<models::QueueItem> ProcessingQueue::list(std::optional<models::QueueStatus> status)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto filter = status ? statusIs(*status) : local_store::matchAll();
        std::vector<models::QueueItem> items;
        for (const auto &r : store_->queryOrdered(models::QUEUE_ITEMS, filter, local_store::OrderBy{"createdAt", true}))
            items.push_back(r.get<models::QueueItem>());
        return items;
    }

    QueueStats ProcessingQueue::stats()
    {
        QueueStats stats;
        for (const auto &item : list())
        {
            switch (item.status)
            {
            case models::QueueStatus::Pending:
                ++stats.pending;
                break;
            case models::QueueStatus::Processing:
                ++stats.processing;
                break;
            case models::QueueStatus::Completed:
                ++stats.completed;
                break;
            case models::QueueStatus::Failed:
                ++stats.failed;
                break;
            }
        }
        return stats;
    }

    bool ProcessingQueue::purge(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto item = getLocked(id);
        if (!item)
            return false;
        if (!item->isTerminal())
        {
            MyLogger::warning("Queue >> refusing to purge active item " + id);
            return false;
        }
        if (!store_->remove(models::QUEUE_ITEMS, id))
            return false;
        MyLogger::info("Queue >> purged " + id);
        return true;
    }

    size_t ProcessingQueue::purgeCompleted()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (const auto &r : store_->queryOrdered(models::QUEUE_ITEMS, statusIs(models::QueueStatus::Completed)))
        {
            if (store_->remove(models::QUEUE_ITEMS, r.at("id").get<std::string>()))
                ++removed;
        }
        if (removed > 0)
            MyLogger::info("Queue >> cleaned up " + std::to_string(removed) + " completed items");
        return removed;
    }

    std::optional<models::QueueItem> ProcessingQueue::requeueFailed(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto failed = getLocked(id);
        if (!failed || failed->status != models::QueueStatus::Failed)
        {
            MyLogger::warning("Queue >> requeueFailed: " + id + " is not a failed item");
            return std::nullopt;
        }
        return enqueueLocked(failed->captureId, failed->sourcePath, failed->sourceDuration);
    }

    bool ProcessingQueue::save(const models::QueueItem &item)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_->put(models::QUEUE_ITEMS, item.id, json(item));
    }

    QueueWorker::QueueWorker(ProcessingQueue &queue, processor::CaptureProcessor &processor)
        : queue_(queue), processor_(processor) {}

    bool QueueWorker::processNext()
    {
        auto item = queue_.dequeueNext();
        if (!item)
            return false;

        processor::ProcessOutcome outcome;
        try
        {
            outcome = processor_.process(*item);
        }
        catch (const std::exception &e)
        {
            outcome = processor::ProcessOutcome::failure(errors::ErrorKind::TransientIO,
                                                         std::string("Processor threw: ") + e.what());
        }

        if (outcome.success)
        {
            if (queue_.markCompleted(item->id) && on_completed_)
                on_completed_(*item);
        }
        else
            queue_.markFailed(item->id, outcome.err, outcome.kind);
        return true;
    }

    size_t QueueWorker::drain()
    {
        size_t processed = 0;
        while (processNext())
            ++processed;
        return processed;
    }
} // namespace processing_queue
