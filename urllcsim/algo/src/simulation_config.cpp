#include <urllcsim/algo/simulation_config.hpp>
#include <urllcsim/algo/device.hpp>
#include <urllcsim/algo/error.hpp>

#include <cmath>
#include <string>

namespace urllcsim::algo {

void validate(const SimulationConfig& config) {
    if (config.duration <= core::Duration::zero()) {
        throw ConfigurationError("simulation duration must be positive");
    }
    if (config.device_classes.empty()) {
        throw ConfigurationError("at least one device class is required");
    }
    if (config.throughput_window == 0) {
        throw ConfigurationError("throughput window must hold at least one sample");
    }
    if (config.base_station.num_resource_blocks == 0) {
        throw ConfigurationError("base station needs at least one resource block");
    }
    if (config.base_station.subcarriers == 0) {
        throw ConfigurationError("resource blocks need at least one subcarrier");
    }
    if (config.base_station.slot_duration <= core::Duration::zero()) {
        throw ConfigurationError("slot duration must be positive");
    }
    if (config.policy_params.round_robin_quantum <= core::Duration::zero()) {
        throw ConfigurationError("round-robin quantum must be positive");
    }
    if (!(config.policy_params.pf_epsilon > 0.0)) {
        throw ConfigurationError("proportional-fair epsilon must be positive");
    }

    for (std::size_t i = 0; i < config.device_classes.size(); ++i) {
        const auto& dc = config.device_classes[i];
        const std::string ctx = "device class " + std::to_string(i) + ": ";

        if (!std::isfinite(dc.arrival_rate) || dc.arrival_rate < 0.0) {
            throw ConfigurationError(ctx + "arrival rate must be a non-negative number");
        }
        if (dc.arrival_rate > Device::MAX_INTERARRIVAL_MEANS / Device::MIN_INTERARRIVAL_S) {
            throw ConfigurationError(ctx + "arrival rate is too high");
        }
        if (dc.packet_size_bits == 0) {
            throw ConfigurationError(ctx + "packet size must be positive");
        }
        if (dc.priorities.empty()) {
            throw ConfigurationError(ctx + "priority list is empty");
        }
        for (int p : dc.priorities) {
            if (p < 0) {
                throw ConfigurationError(ctx + "priorities must not be negative");
            }
        }
        if (dc.max_latency < core::Duration::zero()) {
            throw ConfigurationError(ctx + "max latency must not be negative");
        }
        if (!(dc.min_distance_m > 0.0) || dc.max_distance_m < dc.min_distance_m) {
            throw ConfigurationError(ctx + "distance range must be positive and ordered");
        }
    }
}

} // namespace urllcsim::algo
