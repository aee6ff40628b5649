#include <urllcsim/core/engine.hpp>
#include <urllcsim/core/error.hpp>
#include <urllcsim/core/race.hpp>

#include <gtest/gtest.h>

using namespace urllcsim::core;

TEST(RaceTest, FirstReportWins) {
    Race race(2);
    EXPECT_FALSE(race.settled());
    EXPECT_FALSE(race.winner().has_value());

    EXPECT_TRUE(race.finish(1));
    EXPECT_TRUE(race.settled());
    EXPECT_EQ(race.winner().value(), 1U);

    EXPECT_FALSE(race.finish(0));
    EXPECT_FALSE(race.finish(1));
    EXPECT_EQ(race.winner().value(), 1U);
}

TEST(RaceTest, ArmOutOfRangeThrows) {
    Race race(2);
    EXPECT_THROW(race.finish(2), OutOfRangeError);
    EXPECT_FALSE(race.settled());
}

TEST(RaceTest, ZeroArmsThrows) {
    EXPECT_THROW(Race{0}, OutOfRangeError);
}

TEST(RaceTest, EngineTimersDecideWinner) {
    Engine engine;
    Race race(2);

    engine.add_timer(time_from_seconds(0.002), [&] { race.finish(0); });
    engine.add_timer(time_from_seconds(0.001), EventPriority::DEADLINE_EXPIRY,
                     [&] { race.finish(1); });
    engine.run();

    EXPECT_EQ(race.winner().value(), 1U);
}

TEST(RaceTest, SimultaneousReportsFavourDefaultPriority) {
    Engine engine;
    Race race(2);

    engine.add_timer(time_from_seconds(0.001), EventPriority::DEADLINE_EXPIRY,
                     [&] { race.finish(1); });
    engine.add_timer(time_from_seconds(0.001), [&] { race.finish(0); });
    engine.run();

    EXPECT_EQ(race.winner().value(), 0U);
}
