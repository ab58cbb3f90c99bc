#include "rtp/JitterTracker.h"
#include "utils/Time.h"
#include <gtest/gtest.h>

TEST(JitterTrackerTest, evenSpacingHasNoJitter)
{
    rtp::JitterTracker tracker(90000);
    for (uint32_t i = 0; i < 50; ++i)
    {
        tracker.update(i * 20 * utils::Time::ms, 1000 + i * 1800);
    }
    EXPECT_EQ(0u, tracker.get());
}

TEST(JitterTrackerTest, latePacketMovesEstimateBySixteenth)
{
    rtp::JitterTracker tracker(90000);
    tracker.update(0, 0);
    tracker.update(20 * utils::Time::ms, 1800);
    // 10ms late is 900 units of transit difference
    tracker.update(50 * utils::Time::ms, 3600);
    EXPECT_EQ(900u / 16, tracker.get());

    tracker.update(60 * utils::Time::ms, 5400);
    EXPECT_GT(tracker.get(), 900u / 16);
}

TEST(JitterTrackerTest, estimateIsCapped)
{
    rtp::JitterTracker tracker(8000);
    tracker.update(0, 0);
    for (int i = 1; i < 400; ++i)
    {
        tracker.update(uint64_t(i) * 10 * utils::Time::sec, 0);
    }
    EXPECT_LE(tracker.get(), 3u * 8000);
    EXPECT_EQ(8000u, tracker.getRtpFrequency());
}
