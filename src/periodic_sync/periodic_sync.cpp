#include "periodic_sync.hpp"
#include "../logger/Mylogger.hpp"

namespace periodic_sync
{
    PeriodicSync::PeriodicSync(boost::asio::io_context &io,
                               std::shared_ptr<network::NetworkObserver> network,
                               std::shared_ptr<sync_orchestrator::SyncRequester> requester,
                               std::chrono::milliseconds interval)
        : network_(std::move(network)),
          requester_(std::move(requester)),
          interval_(interval),
          timer_(io)
    {
        if (interval_.count() <= 0)
            throw errors::validationError("Periodic sync interval must be positive");
    }

    PeriodicSync::~PeriodicSync()
    {
        running_ = false;
        timer_.cancel();
    }

    void PeriodicSync::start()
    {
        if (running_.exchange(true))
            return;
        MyLogger::info("Periodic >> started, every " + std::to_string(interval_.count()) + " ms");
        scheduleNext();
    }

    void PeriodicSync::stop()
    {
        if (!running_.exchange(false))
            return;
        ++generation_;
        timer_.cancel();
        MyLogger::info("Periodic >> stopped");
    }

    void PeriodicSync::tick()
    {
        ++ticks_;
        if (!network_->getCurrentState().connected)
        {
            ++skipped_ticks_;
            MyLogger::debug("Periodic >> offline, tick skipped");
            return;
        }

        auto report = requester_->sync(sync_orchestrator::SyncRequest{sync_orchestrator::Priority::Low,
                                                                      sync_orchestrator::Source::Periodic});
        if (!report.success && !report.skipped())
            MyLogger::warning("Periodic >> sync failed: " + report.error);
    }

    void PeriodicSync::scheduleNext()
    {
        timer_.expires_after(interval_);
        const uint64_t generation = generation_;
        timer_.async_wait([this, generation](const boost::system::error_code &ec)
                          {
                              if (ec == boost::asio::error::operation_aborted || !running_ ||
                                  generation != generation_)
                                  return;
                              tick();
                              if (running_)
                                  scheduleNext(); });
    }
} // namespace periodic_sync
