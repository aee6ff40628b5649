#include <urllcsim/io/result_writer.hpp>

#include <rapidjson/document.h>

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using namespace urllcsim::io;
using namespace urllcsim::algo;

namespace {

RunResult make_result(uint32_t seed, double reliability) {
    RunResult result;
    result.seed = seed;
    result.policy = "edf";
    result.duration_s = 1.0;
    result.reliability = reliability;
    result.fairness_index = 0.5;
    result.packets_sent = 9;
    result.packets_dropped = 1;

    DeviceStats stats;
    stats.device_id = 0;
    stats.priority = 2;
    stats.distance_m = 42.0;
    stats.packets_sent = 9;
    result.per_device_stats.push_back(stats);
    return result;
}

} // namespace

TEST(ResultWriterTest, DocumentStructure) {
    std::vector<RunResult> results{make_result(42, 0.9), make_result(43, 0.7)};

    rapidjson::Document doc;
    doc.Parse(results_to_string(results).c_str());
    ASSERT_FALSE(doc.HasParseError());

    const auto& runs = doc["runs"];
    ASSERT_EQ(runs.Size(), 2U);
    EXPECT_EQ(runs[0]["seed"].GetUint(), 42U);
    EXPECT_STREQ(runs[0]["policy"].GetString(), "edf");
    EXPECT_DOUBLE_EQ(runs[1]["reliability"].GetDouble(), 0.7);
    EXPECT_EQ(runs[0]["packets_dropped"].GetUint64(), 1U);

    const auto& device = runs[0]["devices"][0];
    EXPECT_EQ(device["priority"].GetInt(), 2);
    EXPECT_DOUBLE_EQ(device["distance"].GetDouble(), 42.0);
    EXPECT_EQ(device["packets_sent"].GetUint64(), 9U);

    const auto& summary = doc["summary"];
    EXPECT_EQ(summary["runs"].GetUint64(), 2U);
    EXPECT_DOUBLE_EQ(summary["reliability"].GetDouble(), 0.8);
    EXPECT_DOUBLE_EQ(summary["fairness"].GetDouble(), 0.5);
}

TEST(ResultWriterTest, EmptyResults) {
    rapidjson::Document doc;
    doc.Parse(results_to_string({}).c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["runs"].Size(), 0U);
    EXPECT_DOUBLE_EQ(doc["summary"]["latency"].GetDouble(), 0.0);
}

TEST(ResultWriterTest, StreamOutput) {
    std::vector<RunResult> results{make_result(1, 1.0)};
    std::ostringstream oss;
    write_results(results, oss);
    EXPECT_NE(oss.str().find("\"seed\": 1"), std::string::npos) << oss.str();
}
