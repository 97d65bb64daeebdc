#include <gtest/gtest.h>

#include "mocks.hpp"
#include "processor/capture_processor.hpp"

class CommandProcessorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        item_.id = "tq_1";
        item_.captureId = "cap-1";
        item_.sourcePath = dir_.file("it's a capture.wav");
        testing_support::writeFile(item_.sourcePath, 64);
    }

    testing_support::TempDir dir_;
    models::QueueItem item_;
};

TEST_F(CommandProcessorTest, ExitZeroIsSuccess)
{
    processor::CommandProcessor proc("test -f");
    auto outcome = proc.process(item_);
    EXPECT_TRUE(outcome.success) << outcome.err;
}

TEST_F(CommandProcessorTest, ExitTwoIsPermanent)
{
    processor::CommandProcessor proc("sh -c 'exit 2'");
    auto outcome = proc.process(item_);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, errors::ErrorKind::PermanentResource);
}

TEST_F(CommandProcessorTest, OtherExitIsTransient)
{
    processor::CommandProcessor proc("false");
    auto outcome = proc.process(item_);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, errors::ErrorKind::TransientIO);
}

TEST_F(CommandProcessorTest, MissingSourceIsPermanentWithoutRunning)
{
    item_.sourcePath = dir_.file("gone.wav");
    processor::CommandProcessor proc("true");
    auto outcome = proc.process(item_);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, errors::ErrorKind::PermanentResource);
}

TEST(ShellQuoteTest, EscapesSingleQuotes)
{
    EXPECT_EQ(processor::CommandProcessor::shellQuote("a b"), "'a b'");
    EXPECT_EQ(processor::CommandProcessor::shellQuote("it's"), "'it'\\''s'");
}
