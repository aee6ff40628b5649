#pragma once

#include <urllcsim/algo/base_station.hpp>
#include <urllcsim/algo/channel_model.hpp>
#include <urllcsim/algo/scheduling_policy.hpp>

#include <urllcsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace urllcsim::algo {

/// @brief A group of devices sharing traffic parameters.
/// @ingroup algo
///
/// Each device of the class draws its distance uniformly from
/// `[min_distance_m, max_distance_m]` and its priority uniformly from
/// `priorities` using the run's random generator.
struct DeviceClass {
    std::size_t count{10};
    double arrival_rate{10.0};
    uint64_t packet_size_bits{1024};
    std::vector<int> priorities{1, 2, 3};
    core::Duration max_latency{core::duration_from_seconds(0.005)};
    double min_distance_m{10.0};
    double max_distance_m{100.0};
};

/// @brief Everything a run needs besides the seed.
/// @ingroup algo
struct SimulationConfig {
    core::Duration duration{core::duration_from_seconds(10.0)};
    BaseStationParams base_station;
    PolicyKind policy{PolicyKind::HybridEdfPreemptive};
    PolicyParams policy_params;
    ChannelParams channel;
    std::vector<DeviceClass> device_classes{DeviceClass{}};
    std::size_t throughput_window{10};
    std::vector<uint32_t> seeds{42, 43, 44, 45, 46};
};

/// @brief Check the parts of @p config no constructor checks.
/// @throws ConfigurationError describing the first problem found.
/// @ingroup algo
void validate(const SimulationConfig& config);

} // namespace urllcsim::algo
