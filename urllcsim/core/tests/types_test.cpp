#include <urllcsim/core/types.hpp>
#include <gtest/gtest.h>

using namespace urllcsim::core;

TEST(DurationTest, Factories) {
    EXPECT_DOUBLE_EQ(duration_to_seconds(duration_from_seconds(0.125)), 0.125);
    EXPECT_EQ(duration_from_nanoseconds(500).nanoseconds(), 500);
    EXPECT_EQ(duration_from_seconds_ceil(1.0).nanoseconds(), 1'000'000'000);
    EXPECT_EQ(Duration::zero(), Duration{});
}

TEST(DurationTest, NearestVersusCeilRounding) {
    // 1.4 ns
    EXPECT_EQ(duration_from_seconds(1.4e-9).nanoseconds(), 1);
    EXPECT_EQ(duration_from_seconds_ceil(1.4e-9).nanoseconds(), 2);
}

TEST(DurationTest, MillisecondValuesAreExact) {
    // Airtimes used throughout the scenarios must land on whole nanoseconds.
    EXPECT_EQ(duration_from_seconds_ceil(0.001).nanoseconds(), 1'000'000);
    EXPECT_EQ(duration_from_seconds_ceil(0.0005).nanoseconds(), 500'000);
    EXPECT_EQ(duration_from_seconds(0.005).nanoseconds(), 5'000'000);
}

TEST(DurationTest, Arithmetic) {
    Duration a = duration_from_seconds(5.0);
    Duration b = duration_from_seconds(3.0);

    EXPECT_DOUBLE_EQ((a + b).seconds(), 8.0);
    EXPECT_DOUBLE_EQ((a - b).seconds(), 2.0);
    EXPECT_DOUBLE_EQ((-b).seconds(), -3.0);

    Duration c = a;
    c -= b;
    c += b;
    EXPECT_EQ(c, a);
    EXPECT_DOUBLE_EQ(duration_ratio(b, a), 0.6);
}

TEST(DurationTest, Ordering) {
    EXPECT_LT(duration_from_seconds(0.001), duration_from_seconds(0.002));
    EXPECT_GT(duration_from_nanoseconds(1), Duration::zero());
}

TEST(TimePointTest, Arithmetic) {
    TimePoint t0 = TimePoint::epoch();
    TimePoint t1 = t0 + duration_from_seconds(2.5);

    EXPECT_DOUBLE_EQ(time_to_seconds(t1), 2.5);
    EXPECT_EQ(t1 - t0, duration_from_seconds(2.5));
    EXPECT_EQ(t1 - duration_from_seconds(2.5), t0);
    EXPECT_EQ(time_from_seconds(2.5), t1);

    t0 += duration_from_seconds(1.0);
    EXPECT_LT(t0, t1);
}
