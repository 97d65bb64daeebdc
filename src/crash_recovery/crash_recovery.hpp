#ifndef CRASH_RECOVERY_HPP
#define CRASH_RECOVERY_HPP

#include <atomic>
#include <memory>
#include <vector>
#include "../local_store/local_store.hpp"
#include "../models/models.hpp"
#include "../processing_queue/processing_queue.hpp"

namespace crash_recovery
{
    // lastError of items whose source vanished while they were processing.
    constexpr const char *SOURCE_MISSING_AFTER_CRASH = "SourceMissingAfterCrash";

    struct RecoveryReport
    {
        std::vector<models::QueueItem> recovered; // back to Pending
        std::vector<models::QueueItem> failed;    // source missing, now Failed
        std::vector<models::UploadRecord> resumableUploads;
        bool alreadyRan = false;

        json toJson() const;
    };

    // Startup scan for queue items orphaned in Processing by a crash.
    // recover() runs once per instance and opens the queue when done.
    class CrashRecovery
    {
    public:
        CrashRecovery(std::shared_ptr<local_store::LocalStore> store,
                      processing_queue::ProcessingQueue &queue,
                      clock_source::Clock clock);

        RecoveryReport recover();

        bool hasRun() const { return ran_; }

        // Items currently stuck in Processing.
        size_t pendingRecoveryCount();

    private:
        std::shared_ptr<local_store::LocalStore> store_;
        processing_queue::ProcessingQueue &queue_;
        clock_source::Clock clock_;
        std::atomic<bool> ran_{false};
    };
} // namespace crash_recovery

#endif // CRASH_RECOVERY_HPP
