#include <urllcsim/io/config_loader.hpp>
#include <urllcsim/io/error.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace urllcsim::io;
using namespace urllcsim::algo;
using namespace urllcsim::core;

class ConfigLoaderTest : public ::testing::Test {};

TEST_F(ConfigLoaderTest, EmptyObjectGivesDefaults) {
    auto config = load_config_from_string("{}");

    EXPECT_DOUBLE_EQ(duration_to_seconds(config.duration), 10.0);
    ASSERT_EQ(config.device_classes.size(), 1U);
    EXPECT_EQ(config.device_classes[0].count, 10U);
    EXPECT_EQ(config.policy, PolicyKind::HybridEdfPreemptive);
    EXPECT_EQ(config.base_station.num_resource_blocks, 3U);
    EXPECT_EQ(config.policy_params.round_robin_quantum, config.base_station.slot_duration);
    ASSERT_TRUE(config.channel.sinr_floor_db.has_value());
    EXPECT_DOUBLE_EQ(*config.channel.sinr_floor_db, 5.0);
    EXPECT_EQ(config.seeds.size(), 5U);
}

TEST_F(ConfigLoaderTest, BaselineKeys) {
    const char* json = R"({
        "sim_duration": 2,
        "num_devices": 4,
        "arrival_rate": 80,
        "packet_size": 2048,
        "priority_levels": [1, 3],
        "max_latency": 0.002,
        "num_resource_blocks": 5,
        "subcarriers": 24,
        "slot_duration": 0.00025,
        "scheduling_policy": "edf",
        "preemption_penalty": 0.0002,
        "transmission_power": 20,
        "noise_power": -170,
        "path_loss_exponent": 4.0,
        "data_rate_base": 20000000,
        "interference_rate": 2,
        "interference_range": [-95, -85],
        "interference_duration": 0.05,
        "initial_interference": -100,
        "sinr_threshold": 3.0,
        "random_seeds": [7, 8]
    })";

    auto config = load_config_from_string(json);

    EXPECT_DOUBLE_EQ(duration_to_seconds(config.duration), 2.0);
    const auto& dc = config.device_classes.at(0);
    EXPECT_EQ(dc.count, 4U);
    EXPECT_DOUBLE_EQ(dc.arrival_rate, 80.0);
    EXPECT_EQ(dc.packet_size_bits, 2048U);
    EXPECT_EQ(dc.priorities, (std::vector<int>{1, 3}));
    EXPECT_EQ(dc.max_latency, duration_from_seconds(0.002));

    EXPECT_EQ(config.base_station.num_resource_blocks, 5U);
    EXPECT_EQ(config.base_station.subcarriers, 24U);
    EXPECT_EQ(config.base_station.slot_duration, duration_from_seconds(0.00025));
    EXPECT_EQ(config.policy_params.round_robin_quantum, duration_from_seconds(0.00025));
    EXPECT_EQ(config.base_station.preemption_penalty, duration_from_seconds(0.0002));
    EXPECT_EQ(config.policy, PolicyKind::EarliestDeadlineFirst);

    EXPECT_DOUBLE_EQ(config.channel.tx_power_dbm, 20.0);
    EXPECT_DOUBLE_EQ(config.channel.noise_psd_dbm_per_hz, -170.0);
    EXPECT_DOUBLE_EQ(config.channel.path_loss_exponent, 4.0);
    EXPECT_DOUBLE_EQ(config.channel.max_data_rate_bps.value(), 2e7);
    EXPECT_DOUBLE_EQ(config.channel.interference_rate, 2.0);
    EXPECT_DOUBLE_EQ(config.channel.interference_min_dbm, -95.0);
    EXPECT_DOUBLE_EQ(config.channel.interference_max_dbm, -85.0);
    EXPECT_EQ(config.channel.interference_duration, duration_from_seconds(0.05));
    EXPECT_DOUBLE_EQ(config.channel.initial_interference_dbm, -100.0);
    EXPECT_DOUBLE_EQ(config.channel.sinr_threshold_db, 3.0);
    EXPECT_EQ(config.seeds, (std::vector<uint32_t>{7, 8}));
}

TEST_F(ConfigLoaderTest, DeviceClassesInheritHomogeneousValues) {
    const char* json = R"({
        "arrival_rate": 10,
        "packet_size": 1024,
        "max_latency": 0.005,
        "device_configs": [
            {"count": 5, "arrival_rate": 20, "packet_size": 512.0, "priority": 1, "max_latency": 0.0025},
            {"count": 5, "arrival_rate": 2.5, "priority": 3, "min_distance": 20, "max_distance": 20}
        ]
    })";

    auto config = load_config_from_string(json);

    ASSERT_EQ(config.device_classes.size(), 2U);
    const auto& high = config.device_classes[0];
    EXPECT_EQ(high.count, 5U);
    EXPECT_EQ(high.packet_size_bits, 512U);
    EXPECT_EQ(high.priorities, (std::vector<int>{1}));
    EXPECT_EQ(high.max_latency, duration_from_seconds(0.0025));

    const auto& low = config.device_classes[1];
    EXPECT_DOUBLE_EQ(low.arrival_rate, 2.5);
    EXPECT_EQ(low.packet_size_bits, 1024U);
    EXPECT_EQ(low.max_latency, duration_from_seconds(0.005));
    EXPECT_DOUBLE_EQ(low.min_distance_m, 20.0);
}

TEST_F(ConfigLoaderTest, NullDisablesFloorAndCap) {
    auto config = load_config_from_string(R"({"sinr_floor": null, "data_rate_base": null})");
    EXPECT_FALSE(config.channel.sinr_floor_db.has_value());
    EXPECT_FALSE(config.channel.max_data_rate_bps.has_value());
}

TEST_F(ConfigLoaderTest, TimeVaryingChannel) {
    auto config = load_config_from_string(R"({"time_varying_channel": {"period": 2.0, "amplitude": 0.5}})");
    ASSERT_TRUE(config.channel.variation.has_value());
    EXPECT_DOUBLE_EQ(config.channel.variation->period_s, 2.0);
    EXPECT_DOUBLE_EQ(config.channel.variation->amplitude, 0.5);
}

TEST_F(ConfigLoaderTest, PolicyAliases) {
    EXPECT_EQ(load_config_from_string(R"({"scheduling_policy": "hybrid-edf"})").policy,
              PolicyKind::HybridEdfPreemptive);
    EXPECT_EQ(load_config_from_string(R"({"scheduling_policy": "fiveg-fixed"})").policy,
              PolicyKind::QciFixedPriority);
}

TEST_F(ConfigLoaderTest, UnknownPolicyIsLoaderError) {
    try {
        (void)load_config_from_string(R"({"scheduling_policy": "lottery"})");
        FAIL() << "expected LoaderError";
    } catch (const LoaderError& e) {
        EXPECT_NE(std::string(e.what()).find("lottery"), std::string::npos);
    }
}

TEST_F(ConfigLoaderTest, SyntaxError) {
    EXPECT_THROW((void)load_config_from_string("{\"sim_duration\": }"), LoaderError);
    EXPECT_THROW((void)load_config_from_string("[1, 2]"), LoaderError);
}

TEST_F(ConfigLoaderTest, WrongTypes) {
    EXPECT_THROW((void)load_config_from_string(R"({"sim_duration": "long"})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"num_devices": 2.5})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"priority_levels": ["high"]})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"interference_range": [-90]})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"random_seeds": []})"), LoaderError);
}

TEST_F(ConfigLoaderTest, ErrorNamesDeviceClass) {
    try {
        (void)load_config_from_string(R"({"device_configs": [{"count": 1}, {"count": "two"}]})");
        FAIL() << "expected LoaderError";
    } catch (const LoaderError& e) {
        EXPECT_NE(std::string(e.what()).find("device_configs[1]"), std::string::npos) << e.what();
    }
}

TEST_F(ConfigLoaderTest, InvalidValuesAreRejected) {
    EXPECT_THROW((void)load_config_from_string(R"({"sim_duration": 0})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"num_resource_blocks": 0})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"priority_levels": []})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"priority_levels": [-1]})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"noise_bandwidth": 0})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"interference_range": [-70, -80]})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"max_latency": -0.001})"), LoaderError);
}

TEST_F(ConfigLoaderTest, MissingFile) {
    EXPECT_THROW((void)load_config("/nonexistent/urllcsim.json"), LoaderError);
}

TEST_F(ConfigLoaderTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "urllcsim_config_loader_test.json";
    {
        std::ofstream file(path);
        file << R"({"sim_duration": 3, "scheduling_policy": "round-robin"})";
    }

    auto config = load_config(path);
    std::filesystem::remove(path);

    EXPECT_DOUBLE_EQ(duration_to_seconds(config.duration), 3.0);
    EXPECT_EQ(config.policy, PolicyKind::RoundRobin);
}
