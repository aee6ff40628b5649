#include <urllcsim/core/engine.hpp>
#include <urllcsim/core/event.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace urllcsim::core;

class TimerTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }

    Engine engine_;
    std::vector<std::string> order_;
};

TEST_F(TimerTest, FiresInTimeOrder) {
    engine_.add_timer(time(3.0), [&] { order_.push_back("c"); });
    engine_.add_timer(time(1.0), [&] { order_.push_back("a"); });
    engine_.add_timer(time(2.0), [&] { order_.push_back("b"); });

    engine_.run();

    EXPECT_EQ(order_, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(TimerTest, SameInstantIsFifo) {
    for (int i = 0; i < 5; ++i) {
        engine_.add_timer(time(1.0), [this, i] { order_.push_back(std::to_string(i)); });
    }

    engine_.run();

    EXPECT_EQ(order_, (std::vector<std::string>{"0", "1", "2", "3", "4"}));
}

TEST_F(TimerTest, DeadlineExpiryYieldsToDefaultPriority) {
    // Deadline guard scheduled first, completion second: completion still wins.
    engine_.add_timer(time(1.0), EventPriority::DEADLINE_EXPIRY,
                      [&] { order_.push_back("deadline"); });
    engine_.add_timer(time(1.0), [&] { order_.push_back("completion"); });

    engine_.run();

    EXPECT_EQ(order_, (std::vector<std::string>{"completion", "deadline"}));
}

TEST_F(TimerTest, CancelPreventsFiring) {
    TimerId id = engine_.add_timer(time(1.0), [&] { order_.push_back("cancelled"); });
    engine_.add_timer(time(2.0), [&] { order_.push_back("kept"); });

    EXPECT_TRUE(id.valid());
    engine_.cancel_timer(id);
    EXPECT_FALSE(id.valid());

    engine_.run();

    EXPECT_EQ(order_, (std::vector<std::string>{"kept"}));
}

TEST_F(TimerTest, CancelInvalidIsNoop) {
    TimerId id;
    engine_.cancel_timer(id);
    EXPECT_FALSE(static_cast<bool>(id));
}

TEST_F(TimerTest, CallbackCanCancelSiblingAtSameInstant) {
    TimerId second;
    TimerId first = engine_.add_timer(time(1.0), [&] {
        first.clear();
        order_.push_back("first");
        engine_.cancel_timer(second);
    });
    second = engine_.add_timer(time(1.0), [&] {
        second.clear();
        order_.push_back("second");
    });

    engine_.run();

    EXPECT_EQ(order_, (std::vector<std::string>{"first"}));
}

TEST(EventKeyTest, Ordering) {
    EventKey a{time_from_seconds(1.0), 0, 5};
    EventKey b{time_from_seconds(1.0), EventPriority::DEADLINE_EXPIRY, 1};
    EventKey c{time_from_seconds(1.0), 0, 6};
    EventKey d{time_from_seconds(0.5), EventPriority::DEADLINE_EXPIRY, 9};

    EXPECT_LT(a, b);
    EXPECT_LT(a, c);
    EXPECT_LT(d, a);
}
