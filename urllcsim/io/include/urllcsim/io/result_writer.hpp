#pragma once

/// @file result_writer.hpp
/// @brief JSON serialization of run results.
/// @ingroup io_results

#include <urllcsim/algo/simulation.hpp>

#include <filesystem>
#include <ostream>
#include <span>
#include <string>

namespace urllcsim::io {

/// @brief Serialize the results of several seeded runs as one JSON document.
///
/// The document has a `runs` array (one object per RunResult, each with a
/// `devices` array) and a `summary` object averaging the run-level metrics
/// over all runs.
///
/// @throws TraceWriteError if the stream fails.
/// @ingroup io_results
void write_results(std::span<const algo::RunResult> results, std::ostream& out);

/// @brief Same as write_results() into a file.
/// @throws TraceWriteError if the file cannot be created or written.
/// @ingroup io_results
void write_results(std::span<const algo::RunResult> results, const std::filesystem::path& path);

/// @brief Serialize the results into a string.
/// @ingroup io_results
[[nodiscard]] std::string results_to_string(std::span<const algo::RunResult> results);

} // namespace urllcsim::io
