#include <urllcsim/algo/metrics.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace urllcsim::algo;

TEST(MetricsTest, MeanOfEmptyIsZero) {
    EXPECT_DOUBLE_EQ(mean(std::vector<double>{}), 0.0);
}

TEST(MetricsTest, Mean) {
    std::vector<double> values{1.0, 2.0, 3.0, 6.0};
    EXPECT_DOUBLE_EQ(mean(values), 3.0);
}

TEST(MetricsTest, PercentileInterpolates) {
    std::vector<double> values{4.0, 1.0, 3.0, 2.0};
    EXPECT_DOUBLE_EQ(percentile(values, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(percentile(values, 100.0), 4.0);
    EXPECT_DOUBLE_EQ(percentile(values, 50.0), 2.5);
    EXPECT_NEAR(percentile(values, 99.0), 3.97, 1e-12);
}

TEST(MetricsTest, PercentileEdgeCases) {
    EXPECT_DOUBLE_EQ(percentile({}, 99.0), 0.0);
    EXPECT_DOUBLE_EQ(percentile({0.002}, 99.0), 0.002);
}

TEST(MetricsTest, JainEqualShares) {
    std::vector<double> values{5.0, 5.0, 5.0, 5.0};
    EXPECT_DOUBLE_EQ(jain_fairness(values), 1.0);
}

TEST(MetricsTest, JainSingleWinner) {
    std::vector<double> values{9.0, 0.0, 0.0};
    EXPECT_DOUBLE_EQ(jain_fairness(values), 1.0 / 3.0);
}

TEST(MetricsTest, JainDegenerate) {
    EXPECT_DOUBLE_EQ(jain_fairness(std::vector<double>{}), 0.0);
    EXPECT_DOUBLE_EQ(jain_fairness(std::vector<double>{0.0, 0.0}), 0.0);
}
