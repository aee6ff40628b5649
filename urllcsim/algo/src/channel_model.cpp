#include <urllcsim/algo/channel_model.hpp>
#include <urllcsim/algo/error.hpp>

#include <urllcsim/core/engine.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>
#include <utility>

namespace urllcsim::algo {

namespace {

double dbm_to_mw(double dbm) {
    return std::pow(10.0, dbm / 10.0);
}

double mw_to_dbm(double mw) {
    return 10.0 * std::log10(mw);
}

} // namespace

ChannelModel::ChannelModel(ChannelParams params)
    : params_(std::move(params))
    , interference_dbm_(params_.initial_interference_dbm) {
    if (!(params_.noise_bandwidth_hz > 0.0)) {
        throw ConfigurationError("noise bandwidth must be positive");
    }
    if (!(params_.subcarrier_bandwidth_hz > 0.0)) {
        throw ConfigurationError("subcarrier bandwidth must be positive");
    }
    if (!(params_.path_loss_exponent > 0.0)) {
        throw ConfigurationError("path loss exponent must be positive");
    }
    if (params_.variation) {
        if (!(params_.variation->period_s > 0.0)) {
            throw ConfigurationError("path loss variation period must be positive");
        }
        if (std::abs(params_.variation->amplitude) >= params_.path_loss_exponent) {
            throw ConfigurationError("path loss variation amplitude must be smaller than the exponent");
        }
    }
    if (params_.interference_rate < 0.0) {
        throw ConfigurationError("interference rate must not be negative");
    }
    if (params_.interference_min_dbm > params_.interference_max_dbm) {
        throw ConfigurationError("interference range is empty");
    }
    if (params_.interference_rate > 0.0 && params_.interference_duration <= core::Duration::zero()) {
        throw ConfigurationError("interference burst duration must be positive");
    }
    if (params_.max_data_rate_bps && !(*params_.max_data_rate_bps > 0.0)) {
        throw ConfigurationError("data rate cap must be positive");
    }
}

double ChannelModel::path_loss_db(double distance_m, core::TimePoint now) const {
    if (!std::isfinite(distance_m) || distance_m <= 0.0) {
        throw ChannelError("distance must be positive, got " + std::to_string(distance_m));
    }

    double slope_scale = 1.0;
    if (params_.variation) {
        const auto& var = *params_.variation;
        double phase = 2.0 * std::numbers::pi * core::time_to_seconds(now) / var.period_s;
        double exponent = params_.path_loss_exponent + var.amplitude * std::sin(phase);
        slope_scale = exponent / params_.path_loss_exponent;
    }
    return 35.3 + 37.6 * slope_scale * std::log10(distance_m);
}

double ChannelModel::noise_power_dbm() const {
    return params_.noise_psd_dbm_per_hz + 10.0 * std::log10(params_.noise_bandwidth_hz);
}

double ChannelModel::sinr_db(double distance_m, core::TimePoint now) const {
    double signal_dbm = params_.tx_power_dbm - path_loss_db(distance_m, now);
    double impairment_mw = dbm_to_mw(noise_power_dbm()) + dbm_to_mw(interference_dbm_);
    double sinr = signal_dbm - mw_to_dbm(impairment_mw);

    if (!std::isfinite(sinr)) {
        throw ChannelError("SINR is not finite");
    }
    if (params_.sinr_floor_db) {
        sinr = std::max(sinr, *params_.sinr_floor_db);
    }
    return sinr;
}

double ChannelModel::data_rate(double sinr_db, std::size_t subcarriers) const {
    if (!std::isfinite(sinr_db)) {
        throw ChannelError("cannot compute a data rate from a non-finite SINR");
    }
    double bandwidth = static_cast<double>(subcarriers) * params_.subcarrier_bandwidth_hz;
    double rate = bandwidth * std::log2(1.0 + std::pow(10.0, sinr_db / 10.0));
    if (params_.max_data_rate_bps) {
        rate = std::min(rate, *params_.max_data_rate_bps);
    }
    if (!std::isfinite(rate) || rate <= 0.0) {
        throw ChannelError("data rate must be positive, got " + std::to_string(rate));
    }
    return rate;
}

void ChannelModel::start_interference(core::Engine& engine, std::mt19937& rng,
                                      std::function<void()> on_change) {
    engine_ = &engine;
    rng_ = &rng;
    on_change_ = std::move(on_change);
    if (params_.interference_rate > 0.0) {
        schedule_next_burst();
    }
}

void ChannelModel::schedule_next_burst() {
    std::exponential_distribution<double> gap(params_.interference_rate);
    core::Duration wait = core::duration_from_seconds(gap(*rng_));
    burst_timer_ = engine_->add_timer(engine_->time() + wait, [this] { begin_burst(); });
}

void ChannelModel::begin_burst() {
    burst_timer_.clear();

    std::uniform_real_distribution<double> level(params_.interference_min_dbm,
                                                 params_.interference_max_dbm);
    interference_dbm_ = level(*rng_);
    burst_active_ = true;
    ++burst_count_;

    engine_->trace([&](core::TraceWriter& w) {
        w.type("interference_burst");
        w.field("level_dbm", interference_dbm_);
    });
    if (on_change_) {
        on_change_();
    }

    burst_timer_ = engine_->add_timer(engine_->time() + params_.interference_duration,
                                      [this] { end_burst(); });
}

void ChannelModel::end_burst() {
    burst_timer_.clear();

    interference_dbm_ = params_.initial_interference_dbm;
    burst_active_ = false;

    engine_->trace([&](core::TraceWriter& w) {
        w.type("interference_end");
        w.field("level_dbm", interference_dbm_);
    });
    if (on_change_) {
        on_change_();
    }

    schedule_next_burst();
}

} // namespace urllcsim::algo
