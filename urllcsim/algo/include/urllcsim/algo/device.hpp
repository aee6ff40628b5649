#pragma once

#include <urllcsim/algo/packet.hpp>

#include <urllcsim/core/race.hpp>
#include <urllcsim/core/timer.hpp>
#include <urllcsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <random>
#include <vector>

namespace urllcsim::core {
class Engine;
}

namespace urllcsim::algo {

class BaseStation;

/// @brief Static description of one device.
/// @ingroup algo
struct DeviceParams {
    double distance_m{50.0};
    double arrival_rate{10.0};        ///< Poisson rate, packets per second.
    uint64_t packet_size_bits{1024};
    int priority{1};                  ///< Lower value means more important.
    core::Duration max_latency{core::duration_from_seconds(0.005)};
    std::size_t throughput_window{10};  ///< Samples in the rolling throughput average.
};

/// @brief A URLLC device: Poisson packet source and per-device metrics.
/// @ingroup algo
///
/// Every generated packet is raced between its transmission and a deadline
/// guard scheduled at `creation_time + max_latency`:
///   - if the transmission reports first, the deadline guard is cancelled
///     and the outcome (delivered, or dropped for low SINR) is recorded;
///   - if the deadline fires first, the packet is counted as dropped and a
///     deadline miss, and the base station is asked to abandon it.
/// A packet is therefore classified at most once.
///
/// Devices register themselves with the base station on construction and
/// must not be moved afterwards.
class Device {
public:
    static constexpr std::size_t TRANSMISSION_ARM = 0;
    static constexpr std::size_t DEADLINE_ARM = 1;

    /// Bounds applied to each exponential inter-arrival draw.
    static constexpr double MIN_INTERARRIVAL_S = 1e-6;
    static constexpr double MAX_INTERARRIVAL_MEANS = 10.0;

    /// @throws ConfigurationError on a negative rate, a non-positive distance
    ///         or an empty throughput window.
    Device(std::size_t id, DeviceParams params, core::Engine& engine,
           BaseStation& base_station, PacketIdGenerator& ids, std::mt19937& rng);

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;
    Device(Device&&) = delete;
    Device& operator=(Device&&) = delete;

    [[nodiscard]] std::size_t id() const noexcept { return id_; }
    [[nodiscard]] const DeviceParams& params() const noexcept { return params_; }
    [[nodiscard]] double distance() const noexcept { return params_.distance_m; }
    [[nodiscard]] int priority() const noexcept { return params_.priority; }

    /// @brief Start the Poisson arrival process (no-op for a zero rate).
    void start();

    /// @brief Generate one packet now and hand it to the base station.
    /// @return The packet id, or nullopt if the packet could not be built.
    std::optional<uint64_t> emit_packet();

    /// @brief Same as emit_packet() with an explicit size.
    std::optional<uint64_t> emit_packet(uint64_t size_bits);

    /// @brief Outcome of a transmission reported by the base station.
    ///
    /// @return False if the packet was already settled by its deadline, in
    ///         which case nothing is recorded.
    bool on_transmission_finished(const Packet& packet, core::Duration latency, double sinr_db,
                                  bool success);

    /// @brief Commit the terminal outcome of @p packet to the counters.
    ///
    /// On success: one more sent packet, a latency and throughput sample,
    /// and the age of information resets. On failure: one more dropped
    /// packet and the age of information catches up with the current time.
    void record_metrics(const Packet& packet, core::Duration latency, bool success);

    [[nodiscard]] uint64_t packets_generated() const noexcept { return packets_generated_; }
    [[nodiscard]] uint64_t packets_sent() const noexcept { return packets_sent_; }
    [[nodiscard]] uint64_t packets_dropped() const noexcept { return packets_dropped_; }
    [[nodiscard]] uint64_t deadline_misses() const noexcept { return deadline_misses_; }
    [[nodiscard]] uint64_t packet_errors() const noexcept { return packet_errors_; }
    [[nodiscard]] uint64_t delivered_bits() const noexcept { return delivered_bits_; }

    /// @brief Latencies of delivered packets, in seconds.
    [[nodiscard]] const std::vector<double>& latencies() const noexcept { return latencies_; }

    /// @brief sent / (sent + dropped), 0 before any terminal outcome.
    [[nodiscard]] double reliability() const noexcept;

    /// @brief Age of information at @p now, in seconds.
    [[nodiscard]] double aoi(core::TimePoint now) const noexcept;

    [[nodiscard]] core::TimePoint last_update_time() const noexcept { return last_update_time_; }

    /// @brief Mean of the last throughput_window per-packet throughputs (bps).
    [[nodiscard]] double average_throughput() const noexcept;

    /// @brief True while @p packet_id is generated but not yet classified.
    [[nodiscard]] bool is_pending(uint64_t packet_id) const noexcept {
        return pending_.contains(packet_id);
    }

    /// @brief Packets generated but not yet classified.
    [[nodiscard]] std::size_t pending_packets() const noexcept { return pending_.size(); }

private:
    struct PendingPacket {
        core::Race race;
        core::TimerId deadline_timer;
        core::TimePoint creation_time;
    };

    void schedule_next_arrival();
    void on_arrival();
    void on_deadline(uint64_t packet_id);
    void commit(core::TimePoint creation_time, uint64_t size_bits, core::Duration latency,
                bool success);

    std::size_t id_;
    DeviceParams params_;
    core::Engine& engine_;             // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    BaseStation& base_station_;        // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    PacketIdGenerator& ids_;           // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::mt19937& rng_;                // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)

    core::TimerId arrival_timer_;
    std::map<uint64_t, PendingPacket> pending_;

    uint64_t packets_generated_{0};
    uint64_t packets_sent_{0};
    uint64_t packets_dropped_{0};
    uint64_t deadline_misses_{0};
    uint64_t packet_errors_{0};
    uint64_t delivered_bits_{0};
    std::vector<double> latencies_;
    std::deque<double> throughput_samples_;
    double aoi_{0.0};
    core::TimePoint last_update_time_{};
};

} // namespace urllcsim::algo
