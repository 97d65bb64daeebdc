#include <gtest/gtest.h>

#include "mocks.hpp"
#include "periodic_sync/periodic_sync.hpp"

using ::testing::_;
using ::testing::AllOf;
using ::testing::AtLeast;
using ::testing::Field;
using ::testing::Return;
using sync_orchestrator::Priority;
using sync_orchestrator::Source;
using sync_orchestrator::SyncRequest;

namespace
{
    sync_orchestrator::SyncReport okReport()
    {
        sync_orchestrator::SyncReport report;
        report.success = true;
        return report;
    }
}

class PeriodicSyncTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        network_ = std::make_shared<testing_support::ManualNetworkObserver>(true);
        requester_ = std::make_shared<testing_support::MockSyncRequester>();
    }

    boost::asio::io_context io_;
    std::shared_ptr<testing_support::ManualNetworkObserver> network_;
    std::shared_ptr<testing_support::MockSyncRequester> requester_;
};

TEST_F(PeriodicSyncTest, RejectsNonPositiveInterval)
{
    EXPECT_THROW({ periodic_sync::PeriodicSync periodic(io_, network_, requester_, std::chrono::milliseconds(0)); },
                 errors::SyncError);
    EXPECT_THROW({ periodic_sync::PeriodicSync periodic(io_, network_, requester_, std::chrono::milliseconds(-5)); },
                 errors::SyncError);
}

TEST_F(PeriodicSyncTest, TickRequestsLowPrioritySync)
{
    periodic_sync::PeriodicSync periodic(io_, network_, requester_, std::chrono::minutes(15));
    EXPECT_CALL(*requester_, sync(AllOf(Field(&SyncRequest::priority, Priority::Low),
                                        Field(&SyncRequest::source, Source::Periodic))))
        .WillOnce(Return(okReport()));

    periodic.tick();
    EXPECT_EQ(periodic.ticks(), 1u);
    EXPECT_EQ(periodic.skippedTicks(), 0u);
}

TEST_F(PeriodicSyncTest, OfflineTickIsSkipped)
{
    periodic_sync::PeriodicSync periodic(io_, network_, requester_, std::chrono::minutes(15));
    network_->setConnected(false);
    EXPECT_CALL(*requester_, sync(_)).Times(0);

    periodic.tick();
    periodic.tick();
    EXPECT_EQ(periodic.ticks(), 2u);
    EXPECT_EQ(periodic.skippedTicks(), 2u);
}

TEST_F(PeriodicSyncTest, FailedSyncDoesNotStopTrigger)
{
    periodic_sync::PeriodicSync periodic(io_, network_, requester_, std::chrono::minutes(15));
    sync_orchestrator::SyncReport failed;
    failed.kind = errors::ErrorKind::TransientIO;
    failed.error = "server down";
    EXPECT_CALL(*requester_, sync(_)).Times(2).WillRepeatedly(Return(failed));

    periodic.start();
    periodic.tick();
    periodic.tick();
    EXPECT_TRUE(periodic.isRunning());
    periodic.stop();
}

TEST_F(PeriodicSyncTest, StartAndStopAreIdempotent)
{
    periodic_sync::PeriodicSync periodic(io_, network_, requester_, std::chrono::minutes(15));
    periodic.stop();
    EXPECT_FALSE(periodic.isRunning());

    periodic.start();
    periodic.start();
    EXPECT_TRUE(periodic.isRunning());
    periodic.stop();
    periodic.stop();
    EXPECT_FALSE(periodic.isRunning());
    io_.poll();
    EXPECT_EQ(periodic.ticks(), 0u);
}

TEST_F(PeriodicSyncTest, TimerFiresWhileRunning)
{
    periodic_sync::PeriodicSync periodic(io_, network_, requester_, std::chrono::milliseconds(20));
    EXPECT_CALL(*requester_, sync(_)).Times(AtLeast(2)).WillRepeatedly(Return(okReport()));

    periodic.start();
    periodic.start();
    io_.run_for(std::chrono::milliseconds(150));
    periodic.stop();

    const size_t ticks = periodic.ticks();
    EXPECT_GE(ticks, 2u);
    // A doubled timer chain would tick about twice as often.
    EXPECT_LE(ticks, 9u);

    io_.restart();
    io_.run_for(std::chrono::milliseconds(60));
    EXPECT_EQ(periodic.ticks(), ticks);
}

TEST_F(PeriodicSyncTest, TimerResumesSyncAfterReconnect)
{
    periodic_sync::PeriodicSync periodic(io_, network_, requester_, std::chrono::milliseconds(20));
    network_->setConnected(false);
    EXPECT_CALL(*requester_, sync(_)).Times(0);

    periodic.start();
    io_.run_for(std::chrono::milliseconds(70));
    EXPECT_GE(periodic.skippedTicks(), 2u);
    EXPECT_EQ(periodic.skippedTicks(), periodic.ticks());
    ::testing::Mock::VerifyAndClearExpectations(requester_.get());

    EXPECT_CALL(*requester_, sync(AllOf(Field(&SyncRequest::priority, Priority::Low),
                                        Field(&SyncRequest::source, Source::Periodic))))
        .Times(AtLeast(1))
        .WillRepeatedly(Return(okReport()));
    network_->setConnected(true);
    const size_t skipped = periodic.skippedTicks();
    io_.run_for(std::chrono::milliseconds(70));
    periodic.stop();

    EXPECT_GT(periodic.ticks(), skipped);
    EXPECT_EQ(periodic.skippedTicks(), skipped);
}
