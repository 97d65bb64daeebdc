#ifndef PERIODIC_SYNC_HPP
#define PERIODIC_SYNC_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <boost/asio.hpp>
#include "../network/network_observer.hpp"
#include "../sync_orchestrator/sync_types.hpp"

namespace periodic_sync
{
    // Asks for a low priority sync every interval while running. A tick
    // taken while offline is skipped, not counted as a failure.
    class PeriodicSync
    {
    public:
        PeriodicSync(boost::asio::io_context &io,
                     std::shared_ptr<network::NetworkObserver> network,
                     std::shared_ptr<sync_orchestrator::SyncRequester> requester,
                     std::chrono::milliseconds interval);
        ~PeriodicSync();

        void start();
        void stop();
        bool isRunning() const { return running_; }

        // One timer firing. Public so gating can be driven without waiting.
        void tick();

        size_t ticks() const { return ticks_; }
        size_t skippedTicks() const { return skipped_ticks_; }

    private:
        void scheduleNext();

        std::shared_ptr<network::NetworkObserver> network_;
        std::shared_ptr<sync_orchestrator::SyncRequester> requester_;
        std::chrono::milliseconds interval_;
        boost::asio::steady_timer timer_;
        std::atomic<bool> running_{false};
        std::atomic<uint64_t> generation_{0}; // bumped by stop() to orphan a stale wait
        std::atomic<size_t> ticks_{0};
        std::atomic<size_t> skipped_ticks_{0};
    };
} // namespace periodic_sync

#endif // PERIODIC_SYNC_HPP
