#pragma once

#include <urllcsim/core/timer.hpp>
#include <urllcsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>

namespace urllcsim::core {
class Engine;
}

namespace urllcsim::algo {

/// @brief Sinusoidal variation of the path-loss exponent.
/// @ingroup algo
///
/// The exponent follows `n(t) = n0 + amplitude * sin(2*pi*t / period)`.
struct PathLossVariation {
    double period_s{1.0};
    double amplitude{0.0};
};

/// @brief Radio parameters of the cell.
/// @ingroup algo
struct ChannelParams {
    double tx_power_dbm{23.0};
    double noise_psd_dbm_per_hz{-174.0};  ///< Thermal noise density.
    double noise_bandwidth_hz{100e6};     ///< Bandwidth the noise floor is integrated over.
    double path_loss_exponent{3.5};       ///< Reference exponent n0 for the variation.
    std::optional<PathLossVariation> variation;

    double initial_interference_dbm{-90.0};  ///< Level outside bursts.
    double interference_rate{1.0};           ///< Bursts per second; 0 disables bursts.
    double interference_min_dbm{-90.0};
    double interference_max_dbm{-80.0};
    core::Duration interference_duration{core::duration_from_seconds(0.1)};

    std::optional<double> sinr_floor_db{5.0};  ///< Lower clamp; nullopt disables it.
    double sinr_threshold_db{5.0};             ///< Minimum SINR for a successful delivery.
    double subcarrier_bandwidth_hz{30e3};
    std::optional<double> max_data_rate_bps;   ///< Cap on one block's rate.
};

/// @brief Path loss, SINR and Shannon-rate model plus the interference process.
/// @ingroup algo
///
/// Path loss follows the urban-macro form
/// `PL(d) = 35.3 + 37.6 * (n(t) / n0) * log10(d)`, which reduces to the
/// static `35.3 + 37.6 * log10(d)` when no variation is configured.
/// Noise and interference powers are summed in the linear domain.
///
/// The interference process alternates between the baseline level and
/// bursts: after an exponentially distributed wait a burst level is drawn
/// uniformly from `[interference_min_dbm, interference_max_dbm]` and held
/// for `interference_duration`. Both edges invoke the change callback so
/// the base station can refresh the SINR of ongoing transmissions.
class ChannelModel {
public:
    /// @throws ConfigurationError on inconsistent parameters.
    explicit ChannelModel(ChannelParams params);

    ChannelModel(const ChannelModel&) = delete;
    ChannelModel& operator=(const ChannelModel&) = delete;
    ChannelModel(ChannelModel&&) = delete;
    ChannelModel& operator=(ChannelModel&&) = delete;

    [[nodiscard]] const ChannelParams& params() const noexcept { return params_; }

    /// @brief Path loss in dB at @p distance_m metres and time @p now.
    /// @throws ChannelError if the distance is not a positive finite number.
    [[nodiscard]] double path_loss_db(double distance_m, core::TimePoint now) const;

    /// @brief Thermal noise power over the noise bandwidth, in dBm.
    [[nodiscard]] double noise_power_dbm() const;

    /// @brief SINR in dB for a device at @p distance_m, clamped to the floor.
    /// @throws ChannelError on invalid distance or a non-finite result.
    [[nodiscard]] double sinr_db(double distance_m, core::TimePoint now) const;

    /// @brief Shannon rate of a block with @p subcarriers subcarriers, in bps.
    /// @throws ChannelError if @p sinr_db is not finite or the rate is not positive.
    [[nodiscard]] double data_rate(double sinr_db, std::size_t subcarriers) const;

    /// @brief True if @p sinr_db is good enough for a successful delivery.
    [[nodiscard]] bool meets_threshold(double sinr_db) const noexcept {
        return sinr_db >= params_.sinr_threshold_db;
    }

    [[nodiscard]] double interference_dbm() const noexcept { return interference_dbm_; }
    void set_interference_dbm(double level) noexcept { interference_dbm_ = level; }

    [[nodiscard]] bool burst_active() const noexcept { return burst_active_; }
    [[nodiscard]] uint64_t burst_count() const noexcept { return burst_count_; }

    /// @brief Start the burst process on @p engine.
    ///
    /// Does nothing when `interference_rate` is zero. @p engine and @p rng
    /// must outlive the model.
    void start_interference(core::Engine& engine, std::mt19937& rng,
                            std::function<void()> on_change);

private:
    void schedule_next_burst();
    void begin_burst();
    void end_burst();

    ChannelParams params_;
    double interference_dbm_;
    bool burst_active_{false};
    uint64_t burst_count_{0};

    core::Engine* engine_{nullptr};
    std::mt19937* rng_{nullptr};
    std::function<void()> on_change_;
    core::TimerId burst_timer_;
};

} // namespace urllcsim::algo
