#include <urllcsim/algo/device.hpp>
#include <urllcsim/algo/base_station.hpp>
#include <urllcsim/algo/error.hpp>

#include <urllcsim/core/engine.hpp>

#include <algorithm>
#include <numeric>
#include <string_view>
#include <utility>

namespace urllcsim::algo {

Device::Device(std::size_t id, DeviceParams params, core::Engine& engine,
               BaseStation& base_station, PacketIdGenerator& ids, std::mt19937& rng)
    : id_(id)
    , params_(params)
    , engine_(engine)
    , base_station_(base_station)
    , ids_(ids)
    , rng_(rng)
    , last_update_time_(engine.time()) {
    if (params_.arrival_rate < 0.0) {
        throw ConfigurationError("device arrival rate must not be negative");
    }
    if (!(params_.distance_m > 0.0)) {
        throw ConfigurationError("device distance must be positive");
    }
    if (params_.throughput_window == 0) {
        throw ConfigurationError("throughput window must hold at least one sample");
    }
    base_station_.register_device(*this);
}

void Device::start() {
    if (params_.arrival_rate > 0.0) {
        schedule_next_arrival();
    }
}

void Device::schedule_next_arrival() {
    std::exponential_distribution<double> gap(params_.arrival_rate);
    double wait = gap(rng_);
    wait = std::min(wait, MAX_INTERARRIVAL_MEANS / params_.arrival_rate);
    wait = std::max(wait, MIN_INTERARRIVAL_S);

    arrival_timer_ = engine_.add_timer(engine_.time() + core::duration_from_seconds(wait),
                                       [this] { on_arrival(); });
}

void Device::on_arrival() {
    arrival_timer_.clear();
    emit_packet();
    schedule_next_arrival();
}

std::optional<uint64_t> Device::emit_packet() {
    return emit_packet(params_.packet_size_bits);
}

std::optional<uint64_t> Device::emit_packet(uint64_t size_bits) {
    const core::TimePoint now = engine_.time();
    const uint64_t packet_id = ids_.next();
    ++packets_generated_;

    std::optional<Packet> packet;
    try {
        packet.emplace(packet_id, id_, now, size_bits, params_.priority, params_.max_latency);
    } catch (const PacketError& e) {
        ++packet_errors_;
        commit(now, size_bits, core::Duration::zero(), false);
        engine_.trace([&](core::TraceWriter& w) {
            w.type("packet_error");
            w.field("device_id", static_cast<uint64_t>(id_));
            w.field("packet_id", packet_id);
            w.field("reason", std::string_view{e.what()});
        });
        return std::nullopt;
    }

    engine_.trace([&](core::TraceWriter& w) {
        w.type("packet_arrival");
        w.field("device_id", static_cast<uint64_t>(id_));
        w.field("packet_id", packet_id);
        w.field("size", size_bits);
        w.field("priority", static_cast<uint64_t>(params_.priority));
        w.field("deadline", core::time_to_seconds(packet->deadline()));
    });

    PendingPacket entry{core::Race{2}, core::TimerId{}, now};
    entry.deadline_timer = engine_.add_timer(packet->deadline(), core::EventPriority::DEADLINE_EXPIRY,
                                             [this, packet_id] { on_deadline(packet_id); });
    pending_.emplace(packet_id, std::move(entry));

    base_station_.dispatch(*this, std::move(*packet));
    return packet_id;
}

void Device::on_deadline(uint64_t packet_id) {
    auto it = pending_.find(packet_id);
    if (it == pending_.end()) {
        return;
    }
    it->second.deadline_timer.clear();
    if (!it->second.race.finish(DEADLINE_ARM)) {
        return;
    }

    const core::TimePoint creation = it->second.creation_time;
    pending_.erase(it);

    const core::Duration latency = engine_.time() - creation;
    ++deadline_misses_;
    commit(creation, 0, latency, false);

    engine_.trace([&](core::TraceWriter& w) {
        w.type("drop");
        w.field("device_id", static_cast<uint64_t>(id_));
        w.field("packet_id", packet_id);
        w.field("reason", std::string_view{"deadline_expired"});
        w.field("latency", latency.seconds());
        w.field("reliability", reliability());
        w.field("aoi", aoi(engine_.time()));
    });

    base_station_.abandon(packet_id);
}

bool Device::on_transmission_finished(const Packet& packet, core::Duration latency, double sinr_db,
                                      bool success) {
    auto it = pending_.find(packet.id());
    if (it == pending_.end() || !it->second.race.finish(TRANSMISSION_ARM)) {
        return false;
    }
    engine_.cancel_timer(it->second.deadline_timer);
    pending_.erase(it);

    record_metrics(packet, latency, success);

    engine_.trace([&](core::TraceWriter& w) {
        w.type(success ? "delivered" : "drop");
        w.field("device_id", static_cast<uint64_t>(id_));
        w.field("packet_id", packet.id());
        if (!success) {
            w.field("reason", std::string_view{"low_sinr"});
        }
        w.field("latency", latency.seconds());
        w.field("sinr", sinr_db);
        w.field("throughput", average_throughput());
        w.field("reliability", reliability());
        w.field("aoi", aoi(engine_.time()));
    });
    return true;
}

void Device::record_metrics(const Packet& packet, core::Duration latency, bool success) {
    commit(packet.creation_time(), packet.original_size_bits(), latency, success);
}

void Device::commit(core::TimePoint creation_time, uint64_t size_bits, core::Duration latency,
                    bool success) {
    if (success) {
        ++packets_sent_;
        delivered_bits_ += size_bits;
        latencies_.push_back(latency.seconds());
        aoi_ = 0.0;
        last_update_time_ = std::max(last_update_time_, creation_time);

        double sample = latency > core::Duration::zero()
                            ? static_cast<double>(size_bits) / latency.seconds()
                            : 0.0;
        throughput_samples_.push_back(sample);
        if (throughput_samples_.size() > params_.throughput_window) {
            throughput_samples_.pop_front();
        }
    } else {
        ++packets_dropped_;
        aoi_ = std::max(aoi_, (engine_.time() - last_update_time_).seconds());
    }
}

double Device::reliability() const noexcept {
    uint64_t terminal = packets_sent_ + packets_dropped_;
    if (terminal == 0) {
        return 0.0;
    }
    return static_cast<double>(packets_sent_) / static_cast<double>(terminal);
}

double Device::aoi(core::TimePoint now) const noexcept {
    return std::max(aoi_, (now - last_update_time_).seconds());
}

double Device::average_throughput() const noexcept {
    if (throughput_samples_.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(throughput_samples_.begin(), throughput_samples_.end(), 0.0);
    return sum / static_cast<double>(throughput_samples_.size());
}

} // namespace urllcsim::algo
