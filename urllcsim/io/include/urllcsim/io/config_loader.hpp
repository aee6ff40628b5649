#pragma once

/// @file config_loader.hpp
/// @brief Load a simulation configuration from JSON.
/// @ingroup io_loaders

#include <urllcsim/algo/simulation_config.hpp>

#include <filesystem>
#include <string_view>

namespace urllcsim::io {

/// @brief Load a simulation configuration from a JSON file.
///
/// Every key is optional and falls back to the default of
/// algo::SimulationConfig. Times are in seconds, powers in dBm, bandwidths
/// in Hz. A `device_configs` array replaces the homogeneous population
/// described by `num_devices`, `arrival_rate`, `packet_size`,
/// `priority_levels` and `max_latency`.
///
/// @code{.json}
/// {
///   "sim_duration": 10,
///   "num_devices": 10,
///   "arrival_rate": 10,
///   "scheduling_policy": "hybrid-edf-preemptive",
///   "sinr_floor": null,
///   "random_seeds": [42, 43]
/// }
/// @endcode
///
/// @param path  Filesystem path to the JSON file.
/// @return The validated configuration.
///
/// @throws LoaderError  If the file cannot be read, is not valid JSON, a
///                      field has the wrong type, or a value is rejected.
///
/// @ingroup io_loaders
/// @see load_config_from_string
[[nodiscard]] algo::SimulationConfig load_config(const std::filesystem::path& path);

/// @brief Load a simulation configuration from an in-memory JSON string.
///
/// @throws LoaderError  Same conditions as load_config().
///
/// @ingroup io_loaders
[[nodiscard]] algo::SimulationConfig load_config_from_string(std::string_view json);

} // namespace urllcsim::io
