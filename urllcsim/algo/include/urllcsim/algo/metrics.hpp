#pragma once

#include <span>
#include <vector>

namespace urllcsim::algo {

/// @brief Arithmetic mean; 0 for an empty sample.
/// @ingroup algo_metrics
[[nodiscard]] double mean(std::span<const double> samples);

/// @brief Percentile with linear interpolation between closest ranks.
///
/// @param samples Values in any order (copied and sorted internally).
/// @param pct     Percentile in [0, 100].
/// @return 0 for an empty sample.
/// @ingroup algo_metrics
[[nodiscard]] double percentile(std::vector<double> samples, double pct);

/// @brief Jain's fairness index `(sum x)^2 / (n * sum x^2)`.
///
/// Lies in [1/n, 1] for non-negative values with at least one positive
/// entry; 0 when the sample is empty or all zero.
/// @ingroup algo_metrics
[[nodiscard]] double jain_fairness(std::span<const double> values);

} // namespace urllcsim::algo
