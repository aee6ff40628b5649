#include "cell_fixture.hpp"

#include <urllcsim/algo/error.hpp>
#include <urllcsim/core/error.hpp>

#include <gtest/gtest.h>

using namespace urllcsim::algo;
using namespace urllcsim::core;

class DeviceTest : public CellTest {
protected:
    void SetUp() override { make_cell(PolicyKind::EarliestDeadlineFirst); }

    static Packet packet(uint64_t id, double created_s, uint64_t bits = 1000) {
        return Packet(id, 0, time(created_s), bits, 1, duration(0.005));
    }
};

TEST_F(DeviceTest, FreshDeviceHasNoOutcomes) {
    auto& dev = add_device(1);
    EXPECT_EQ(dev.packets_generated(), 0U);
    EXPECT_DOUBLE_EQ(dev.reliability(), 0.0);
    EXPECT_DOUBLE_EQ(dev.average_throughput(), 0.0);
    EXPECT_DOUBLE_EQ(dev.aoi(TimePoint::epoch()), 0.0);
}

TEST_F(DeviceTest, InvalidParametersAreRejected) {
    DeviceParams params;
    params.arrival_rate = -1.0;
    EXPECT_THROW(Device(0, params, engine_, *base_station_, ids_, rng_), ConfigurationError);

    params = DeviceParams{};
    params.distance_m = 0.0;
    EXPECT_THROW(Device(0, params, engine_, *base_station_, ids_, rng_), ConfigurationError);

    params = DeviceParams{};
    params.throughput_window = 0;
    EXPECT_THROW(Device(0, params, engine_, *base_station_, ids_, rng_), ConfigurationError);
}

TEST_F(DeviceTest, DuplicateRegistrationIsRejected) {
    add_device(1);
    DeviceParams params;
    EXPECT_THROW(Device(0, params, engine_, *base_station_, ids_, rng_), InvalidStateError);
}

TEST_F(DeviceTest, SuccessUpdatesCounters) {
    auto& dev = add_device(1);
    dev.record_metrics(packet(1, 0.0), duration(0.002), true);

    EXPECT_EQ(dev.packets_sent(), 1U);
    EXPECT_EQ(dev.delivered_bits(), 1000U);
    ASSERT_EQ(dev.latencies().size(), 1U);
    EXPECT_NEAR(dev.latencies()[0], 0.002, 1e-12);
    EXPECT_DOUBLE_EQ(dev.reliability(), 1.0);
    EXPECT_DOUBLE_EQ(dev.average_throughput(), 5e5);
}

TEST_F(DeviceTest, FailureUpdatesCounters) {
    auto& dev = add_device(1);
    dev.record_metrics(packet(1, 0.0), duration(0.002), true);
    dev.record_metrics(packet(2, 0.0), duration(0.003), false);

    EXPECT_EQ(dev.packets_sent(), 1U);
    EXPECT_EQ(dev.packets_dropped(), 1U);
    EXPECT_DOUBLE_EQ(dev.reliability(), 0.5);
    EXPECT_EQ(dev.latencies().size(), 1U);
}

TEST_F(DeviceTest, AgeOfInformationTracksFreshestDelivery) {
    auto& dev = add_device(1);
    dev.record_metrics(packet(1, 0.4), duration(0.002), true);
    EXPECT_EQ(dev.last_update_time(), time(0.4));
    EXPECT_NEAR(dev.aoi(time(1.0)), 0.6, 1e-9);

    // An older packet delivered later does not move the update time back.
    dev.record_metrics(packet(2, 0.1), duration(0.002), true);
    EXPECT_EQ(dev.last_update_time(), time(0.4));
}

TEST_F(DeviceTest, ThroughputWindowKeepsRecentSamples) {
    DeviceParams params;
    params.arrival_rate = 0.0;
    params.throughput_window = 2;
    Device dev(0, params, engine_, *base_station_, ids_, rng_);

    dev.record_metrics(packet(1, 0.0), duration(0.001), true);  // 1e6 bps
    dev.record_metrics(packet(2, 0.0), duration(0.002), true);  // 5e5 bps
    dev.record_metrics(packet(3, 0.0), duration(0.004), true);  // 2.5e5 bps

    EXPECT_DOUBLE_EQ(dev.average_throughput(), 3.75e5);
}

TEST_F(DeviceTest, EmitPacketTracksPending) {
    auto& dev = add_device(1);
    std::optional<uint64_t> id;
    engine_.add_timer(TimePoint::epoch(), [&] { id = dev.emit_packet(); });
    engine_.run(time(0.0001));

    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(dev.is_pending(*id));
    EXPECT_EQ(dev.packets_generated(), 1U);

    engine_.run();
    EXPECT_FALSE(dev.is_pending(*id));
    EXPECT_EQ(dev.pending_packets(), 0U);
}

TEST_F(DeviceTest, ZeroSizePacketIsContained) {
    auto& dev = add_device(1);
    std::optional<uint64_t> id{0};
    engine_.add_timer(TimePoint::epoch(), [&] { id = dev.emit_packet(0); });
    engine_.run();

    EXPECT_FALSE(id.has_value());
    EXPECT_EQ(dev.packets_generated(), 1U);
    EXPECT_EQ(dev.packet_errors(), 1U);
    EXPECT_EQ(dev.packets_dropped(), 1U);
    EXPECT_EQ(base_station_->waiting_count(), 0U);
}

TEST_F(DeviceTest, PoissonArrivalsStayWithinBounds) {
    DeviceParams params;
    params.distance_m = 10.0;
    params.arrival_rate = 200.0;
    params.packet_size_bits = 100;
    Device dev(0, params, engine_, *base_station_, ids_, rng_);

    dev.start();
    engine_.run(time(1.0));

    // 200 packets expected; the draw is bounded but random.
    EXPECT_GT(dev.packets_generated(), 100U);
    EXPECT_LT(dev.packets_generated(), 400U);
    EXPECT_EQ(dev.packets_generated(), ids_.issued());
}

TEST_F(DeviceTest, ZeroRateGeneratesNothing) {
    auto& dev = add_device(1);
    dev.start();
    engine_.run(time(1.0));
    EXPECT_EQ(dev.packets_generated(), 0U);
}
