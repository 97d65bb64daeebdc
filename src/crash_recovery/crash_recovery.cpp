#include "crash_recovery.hpp"
#include <algorithm>
#include "../fsUtils/fsUtils.hpp"
#include "../logger/Mylogger.hpp"

namespace crash_recovery
{
    json RecoveryReport::toJson() const
    {
        json j;
        j["recovered"] = json::array();
        for (const auto &item : recovered)
            j["recovered"].push_back(item.id);
        j["failed"] = json::array();
        for (const auto &item : failed)
            j["failed"].push_back(item.id);
        j["resumableUploads"] = json::array();
        for (const auto &record : resumableUploads)
            j["resumableUploads"].push_back(record.uploadId);
        j["alreadyRan"] = alreadyRan;
        return j;
    }

    CrashRecovery::CrashRecovery(std::shared_ptr<local_store::LocalStore> store,
                                 processing_queue::ProcessingQueue &queue,
                                 clock_source::Clock clock)
        : store_(std::move(store)), queue_(queue), clock_(std::move(clock)) {}

    size_t CrashRecovery::pendingRecoveryCount()
    {
        return queue_.list(models::QueueStatus::Processing).size();
    }

    RecoveryReport CrashRecovery::recover()
    {
        RecoveryReport report;
        if (ran_.exchange(true))
        {
            MyLogger::warning("Recovery >> already ran in this process");
            report.alreadyRan = true;
            return report;
        }

        const int64_t now = clock_();
        for (auto item : queue_.list(models::QueueStatus::Processing))
        {
            item.updatedAt = std::max(now, item.updatedAt);
            if (fsUtils::isUsableFile(item.sourcePath))
            {
                item.status = models::QueueStatus::Pending;
                item.nextAttemptAt = 0;
                if (!queue_.save(item))
                {
                    MyLogger::error("Recovery >> could not reset " + item.id);
                    continue;
                }
                MyLogger::info("Recovery >> " + item.id + " reset to pending");
                report.recovered.push_back(item);
            }
            else
            {
                item.status = models::QueueStatus::Failed;
                item.lastError = std::string(SOURCE_MISSING_AFTER_CRASH);
                if (!queue_.save(item))
                {
                    MyLogger::error("Recovery >> could not fail " + item.id);
                    continue;
                }
                MyLogger::warning("Recovery >> " + item.id + " failed, source missing: " + item.sourcePath);
                report.failed.push_back(item);
            }
        }

        for (const auto &r : store_->queryOrdered(models::UPLOAD_RECORDS,
                                                  local_store::fieldEquals("status", models::toString(models::UploadStatus::InProgress)),
                                                  local_store::OrderBy{"createdAt", true}))
            report.resumableUploads.push_back(r.get<models::UploadRecord>());

        queue_.openForProcessing();
        MyLogger::info("Recovery >> done: " + report.toJson().dump());
        return report;
    }
} // namespace crash_recovery
