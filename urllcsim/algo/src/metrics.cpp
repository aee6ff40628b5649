#include <urllcsim/algo/metrics.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace urllcsim::algo {

double mean(std::span<const double> samples) {
    if (samples.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    return sum / static_cast<double>(samples.size());
}

double percentile(std::vector<double> samples, double pct) {
    if (samples.empty()) {
        return 0.0;
    }
    std::sort(samples.begin(), samples.end());
    if (samples.size() == 1) {
        return samples[0];
    }

    double rank = std::clamp(pct, 0.0, 100.0) / 100.0 * static_cast<double>(samples.size() - 1);
    auto lower = static_cast<std::size_t>(std::floor(rank));
    auto upper = static_cast<std::size_t>(std::ceil(rank));
    if (lower == upper) {
        return samples[lower];
    }
    double frac = rank - static_cast<double>(lower);
    return samples[lower] * (1.0 - frac) + samples[upper] * frac;
}

double jain_fairness(std::span<const double> values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    double sum_sq = 0.0;
    for (double v : values) {
        sum += v;
        sum_sq += v * v;
    }
    if (sum_sq <= 0.0) {
        return 0.0;
    }
    return (sum * sum) / (static_cast<double>(values.size()) * sum_sq);
}

} // namespace urllcsim::algo
