#include <urllcsim/algo/error.hpp>
#include <urllcsim/algo/simulation.hpp>

#include <urllcsim/core/error.hpp>

#include <urllcsim/io/trace_writers.hpp>

#include <gtest/gtest.h>

#include <map>
#include <set>

using namespace urllcsim::algo;
using namespace urllcsim::core;

class SimulationTest : public ::testing::Test {
protected:
    static SimulationConfig small_config(PolicyKind policy = PolicyKind::HybridEdfPreemptive) {
        SimulationConfig config;
        config.duration = duration_from_seconds(0.5);
        config.policy = policy;
        config.base_station.num_resource_blocks = 2;
        config.channel.interference_rate = 4.0;
        config.channel.interference_duration = duration_from_seconds(0.02);
        config.device_classes = {DeviceClass{}};
        config.device_classes[0].count = 6;
        config.device_classes[0].arrival_rate = 200.0;
        config.device_classes[0].packet_size_bits = 4096;
        return config;
    }
};

TEST_F(SimulationTest, SameSeedSameResult) {
    RunResult a = run(small_config(), 42);
    RunResult b = run(small_config(), 42);

    EXPECT_EQ(a.packets_generated, b.packets_generated);
    EXPECT_EQ(a.packets_sent, b.packets_sent);
    EXPECT_EQ(a.packets_dropped, b.packets_dropped);
    EXPECT_EQ(a.preemptions, b.preemptions);
    EXPECT_EQ(a.avg_latency, b.avg_latency);
    EXPECT_EQ(a.p99_latency, b.p99_latency);
    EXPECT_EQ(a.fairness_index, b.fairness_index);
    ASSERT_EQ(a.per_device_stats.size(), b.per_device_stats.size());
    for (std::size_t i = 0; i < a.per_device_stats.size(); ++i) {
        EXPECT_EQ(a.per_device_stats[i].distance_m, b.per_device_stats[i].distance_m);
        EXPECT_EQ(a.per_device_stats[i].priority, b.per_device_stats[i].priority);
    }
}

TEST_F(SimulationTest, SameSeedSameTrace) {
    urllcsim::io::MemoryTraceWriter first;
    urllcsim::io::MemoryTraceWriter second;
    (void)run(small_config(), 7, &first);
    (void)run(small_config(), 7, &second);

    ASSERT_EQ(first.records().size(), second.records().size());
    for (std::size_t i = 0; i < first.records().size(); ++i) {
        EXPECT_EQ(first.records()[i].time, second.records()[i].time);
        EXPECT_EQ(first.records()[i].type, second.records()[i].type);
    }
}

TEST_F(SimulationTest, EveryPacketClassifiedAtMostOnce) {
    urllcsim::io::MemoryTraceWriter trace;
    RunResult result = run(small_config(), 3, &trace);

    std::set<uint64_t> arrived;
    for (const auto& r : trace.records_of("packet_arrival")) {
        arrived.insert(r.uint_field("packet_id"));
    }

    std::map<uint64_t, int> outcomes;
    for (const auto& r : trace.records()) {
        if (r.type == "delivered" || r.type == "drop") {
            ++outcomes[r.uint_field("packet_id")];
        }
    }

    for (const auto& [id, count] : outcomes) {
        EXPECT_EQ(count, 1) << "packet " << id;
        EXPECT_TRUE(arrived.contains(id)) << "packet " << id;
    }
    EXPECT_EQ(result.packets_sent + result.packets_dropped, outcomes.size());
    EXPECT_LE(outcomes.size(), result.packets_generated);
}

TEST_F(SimulationTest, MetricsAreWithinBounds) {
    for (auto policy : {PolicyKind::PreemptivePriority, PolicyKind::NonPreemptivePriority,
                        PolicyKind::RoundRobin, PolicyKind::EarliestDeadlineFirst,
                        PolicyKind::ProportionalFair, PolicyKind::HybridEdfPreemptive,
                        PolicyKind::QciFixedPriority}) {
        RunResult result = run(small_config(policy), 11);
        SCOPED_TRACE(result.policy);

        EXPECT_GT(result.packets_generated, 0U);
        EXPECT_GE(result.avg_latency, 0.0);
        EXPECT_LE(result.avg_latency, 0.005 + 1e-9);
        EXPECT_GE(result.reliability, 0.0);
        EXPECT_LE(result.reliability, 1.0);
        EXPECT_GE(result.deadline_miss_rate, 0.0);
        EXPECT_LE(result.deadline_miss_rate, 1.0);
        if (result.total_throughput > 0.0) {
            EXPECT_GE(result.fairness_index, 1.0 / 6.0 - 1e-12);
            EXPECT_LE(result.fairness_index, 1.0 + 1e-12);
        }
        for (const auto& stats : result.per_device_stats) {
            EXPECT_GE(stats.distance_m, 10.0);
            EXPECT_LE(stats.distance_m, 100.0);
            EXPECT_GE(stats.aoi, 0.0);
            EXPECT_LE(stats.packets_sent + stats.packets_dropped, stats.packets_generated);
        }
    }
}

TEST_F(SimulationTest, ActiveTransmissionsNeverExceedBlocks) {
    Simulation sim(small_config(PolicyKind::PreemptivePriority), 5);
    const std::size_t blocks = sim.base_station().blocks().size();
    bool bounded = true;
    for (int k = 1; k < 500; ++k) {
        sim.engine().add_timer(time_from_seconds(0.001 * k), [&] {
            bounded = bounded && sim.base_station().active_transmissions() <= blocks;
        });
    }
    (void)sim.run();
    EXPECT_TRUE(bounded);
}

TEST_F(SimulationTest, SummaryRecordsCloseTheTrace) {
    urllcsim::io::MemoryTraceWriter trace;
    (void)run(small_config(), 1, &trace);

    ASSERT_FALSE(trace.records().empty());
    EXPECT_EQ(trace.records().back().type, "simulation_summary");
    EXPECT_EQ(trace.records_of("device_summary").size(), 6U);
}

TEST_F(SimulationTest, HeterogeneousClasses) {
    SimulationConfig config = small_config(PolicyKind::PreemptivePriority);
    DeviceClass urgent;
    urgent.count = 2;
    urgent.priorities = {1};
    urgent.min_distance_m = 30.0;
    urgent.max_distance_m = 30.0;
    config.device_classes.push_back(urgent);

    Simulation sim(config, 9);
    ASSERT_EQ(sim.device_count(), 8U);
    EXPECT_EQ(sim.device(6).priority(), 1);
    EXPECT_DOUBLE_EQ(sim.device(7).distance(), 30.0);
    EXPECT_THROW((void)sim.device(8), OutOfRangeError);
}

TEST_F(SimulationTest, RunsOnlyOnce) {
    Simulation sim(small_config(), 2);
    (void)sim.run();
    EXPECT_THROW((void)sim.run(), InvalidStateError);
}

TEST_F(SimulationTest, InvalidConfigIsRejected) {
    SimulationConfig config = small_config();
    config.device_classes[0].priorities.clear();
    EXPECT_THROW(Simulation(config, 1), ConfigurationError);

    config = small_config();
    config.duration = Duration::zero();
    EXPECT_THROW((void)run(config, 1), ConfigurationError);
}

TEST_F(SimulationTest, IdleCellReportsZeros) {
    SimulationConfig config = small_config();
    config.device_classes[0].arrival_rate = 0.0;
    RunResult result = run(config, 1);

    EXPECT_EQ(result.packets_generated, 0U);
    EXPECT_DOUBLE_EQ(result.avg_latency, 0.0);
    EXPECT_DOUBLE_EQ(result.reliability, 0.0);
    EXPECT_DOUBLE_EQ(result.fairness_index, 0.0);
    EXPECT_DOUBLE_EQ(result.total_throughput, 0.0);
}
