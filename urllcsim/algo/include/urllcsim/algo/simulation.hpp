#pragma once

#include <urllcsim/algo/base_station.hpp>
#include <urllcsim/algo/channel_model.hpp>
#include <urllcsim/algo/device.hpp>
#include <urllcsim/algo/packet.hpp>
#include <urllcsim/algo/simulation_config.hpp>

#include <urllcsim/core/engine.hpp>
#include <urllcsim/core/trace_writer.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace urllcsim::algo {

/// @brief End-of-run statistics of one device.
/// @ingroup algo_metrics
struct DeviceStats {
    std::size_t device_id{0};
    int priority{0};
    double distance_m{0.0};
    uint64_t packets_generated{0};
    uint64_t packets_sent{0};
    uint64_t packets_dropped{0};
    uint64_t deadline_misses{0};
    double avg_latency{0.0};     ///< Seconds, delivered packets only.
    double p99_latency{0.0};     ///< Seconds, delivered packets only.
    double throughput_bps{0.0};  ///< Delivered bits over the run duration.
    double reliability{0.0};
    double aoi{0.0};             ///< Age of information at the end of the run.
};

/// @brief Aggregate outcome of one run.
/// @ingroup algo_metrics
struct RunResult {
    uint32_t seed{0};
    std::string policy;
    double duration_s{0.0};
    double avg_latency{0.0};         ///< Mean over all delivered packets.
    double p99_latency{0.0};         ///< 99th percentile over all delivered packets.
    double total_throughput{0.0};    ///< Delivered bits per second, all devices.
    double reliability{0.0};         ///< Sent over terminal packets.
    double deadline_miss_rate{0.0};  ///< Deadline drops over terminal packets.
    double avg_aoi{0.0};
    double fairness_index{0.0};      ///< Jain's index over device throughputs.
    uint64_t packets_generated{0};
    uint64_t packets_sent{0};
    uint64_t packets_dropped{0};
    uint64_t preemptions{0};
    uint64_t fragments{0};
    std::vector<DeviceStats> per_device_stats;
};

/// @brief One seeded run: engine, channel, base station and devices.
/// @ingroup algo
///
/// All randomness (device placement and priority, packet arrivals,
/// interference bursts) comes from a single `std::mt19937` seeded with the
/// run's seed, so identical (config, seed) pairs produce identical results.
///
/// @code
/// algo::Simulation sim(config, 42);
/// sim.set_trace_writer(&writer);
/// algo::RunResult result = sim.run();
/// @endcode
class Simulation {
public:
    /// @throws ConfigurationError if @p config is invalid.
    Simulation(SimulationConfig config, uint32_t seed);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = delete;
    Simulation& operator=(Simulation&&) = delete;

    /// @brief Install the trace sink (non-owning); nullptr disables tracing.
    void set_trace_writer(core::TraceWriter* writer) noexcept { engine_.set_trace_writer(writer); }

    /// @brief Run for the configured duration and aggregate the results.
    /// @throws InvalidStateError if called twice.
    /// @throws ChannelError if the radio model fails.
    RunResult run();

    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }
    [[nodiscard]] uint32_t seed() const noexcept { return seed_; }
    [[nodiscard]] core::Engine& engine() noexcept { return engine_; }
    [[nodiscard]] BaseStation& base_station() noexcept { return base_station_; }
    [[nodiscard]] const ChannelModel& channel() const noexcept { return channel_; }
    [[nodiscard]] std::size_t device_count() const noexcept { return devices_.size(); }

    /// @throws OutOfRangeError for an unknown index.
    [[nodiscard]] Device& device(std::size_t index);

private:
    void create_devices();
    [[nodiscard]] RunResult collect_results() const;
    void trace_summary(const RunResult& result);

    SimulationConfig config_;
    uint32_t seed_;
    std::mt19937 rng_;
    core::Engine engine_;
    ChannelModel channel_;
    BaseStation base_station_;
    PacketIdGenerator packet_ids_;
    std::vector<std::unique_ptr<Device>> devices_;
    bool started_{false};
};

/// @brief Build a Simulation for (@p config, @p seed), run it and return its result.
/// @ingroup algo
[[nodiscard]] RunResult run(const SimulationConfig& config, uint32_t seed,
                            core::TraceWriter* writer = nullptr);

} // namespace urllcsim::algo
