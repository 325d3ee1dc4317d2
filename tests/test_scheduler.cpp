#include <gtest/gtest.h>
#include "scheduler.h"
#include "test_support.h"

class SchedulerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        TestSupport::Reset();
        settings.InitDefaults();
        scheduler.Init(settings, 0);
    }

    Config::Settings  settings;
    Scheduler::Engine scheduler;
};

TEST_F(SchedulerTest, PotsEveryTwentyMs)
{
    scheduler.Advance(19);
    EXPECT_FALSE(scheduler.ShouldScanPots());

    scheduler.Advance(20);
    EXPECT_TRUE(scheduler.ShouldScanPots());
    scheduler.MarkPotScan();
    EXPECT_FALSE(scheduler.ShouldScanPots());

    scheduler.Advance(39);
    EXPECT_FALSE(scheduler.ShouldScanPots());
    scheduler.Advance(40);
    EXPECT_TRUE(scheduler.ShouldScanPots());
}

TEST_F(SchedulerTest, EncoderEveryMs)
{
    EXPECT_FALSE(scheduler.ShouldScanEncoder());
    scheduler.Advance(1);
    EXPECT_TRUE(scheduler.ShouldScanEncoder());
    scheduler.MarkEncoderScan();
    EXPECT_FALSE(scheduler.ShouldScanEncoder());
}

TEST_F(SchedulerTest, CountsTicks)
{
    for(uint32_t t = 1; t <= 10; t++)
        scheduler.Advance(t);
    EXPECT_EQ(scheduler.Ticks(), 10u);
    EXPECT_EQ(scheduler.Now(), 10u);
}

TEST_F(SchedulerTest, LargeGapIsReported)
{
    scheduler.Advance(1);
    scheduler.Advance(2000);
    EXPECT_EQ(scheduler.TimeJumps(), 1u);
    EXPECT_TRUE(TestSupport::LogContains("Time jump"));

    // Scans simply resume
    EXPECT_TRUE(scheduler.ShouldScanPots());
}

TEST_F(SchedulerTest, FirstTickIsNotAJump)
{
    scheduler.Advance(5000);
    EXPECT_EQ(scheduler.TimeJumps(), 0u);
}
