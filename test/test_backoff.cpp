#include <gtest/gtest.h>

#include "backoff/backoff.hpp"

TEST(BackoffTest, DoublesFromBase)
{
    backoff::Policy policy{2000, 300000};
    EXPECT_EQ(backoff::exponentialDelay(0, policy), 2000);
    EXPECT_EQ(backoff::exponentialDelay(1, policy), 4000);
    EXPECT_EQ(backoff::exponentialDelay(2, policy), 8000);
    EXPECT_EQ(backoff::exponentialDelay(3, policy), 16000);
}

TEST(BackoffTest, CappedAndNeverOverflows)
{
    backoff::Policy policy{2000, 300000};
    EXPECT_EQ(backoff::exponentialDelay(8, policy), 300000);
    EXPECT_EQ(backoff::exponentialDelay(1000, policy), 300000);
}

TEST(BackoffTest, NegativeAttemptTreatedAsFirst)
{
    backoff::Policy policy{500, 8000};
    EXPECT_EQ(backoff::exponentialDelay(-3, policy), 500);
}
