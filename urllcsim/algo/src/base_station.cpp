#include <urllcsim/algo/base_station.hpp>
#include <urllcsim/algo/channel_model.hpp>
#include <urllcsim/algo/device.hpp>
#include <urllcsim/algo/error.hpp>

#include <urllcsim/core/engine.hpp>
#include <urllcsim/core/error.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <string_view>
#include <utility>

namespace urllcsim::algo {

BaseStation::BaseStation(core::Engine& engine, ChannelModel& channel,
                         std::unique_ptr<SchedulingPolicy> policy, BaseStationParams params)
    : engine_(engine)
    , channel_(channel)
    , policy_(std::move(policy))
    , params_(params) {
    if (!policy_) {
        throw ConfigurationError("base station needs a scheduling policy");
    }
    if (params_.num_resource_blocks == 0) {
        throw ConfigurationError("base station needs at least one resource block");
    }
    if (params_.subcarriers == 0) {
        throw ConfigurationError("resource blocks need at least one subcarrier");
    }
    if (params_.slot_duration <= core::Duration::zero()) {
        throw ConfigurationError("slot duration must be positive");
    }
    if (params_.preemption_penalty < core::Duration::zero()) {
        throw ConfigurationError("preemption penalty must not be negative");
    }

    blocks_.reserve(params_.num_resource_blocks);
    for (std::size_t i = 0; i < params_.num_resource_blocks; ++i) {
        blocks_.emplace_back(i, params_.subcarriers, params_.slot_duration);
    }
}

void BaseStation::register_device(Device& device) {
    const std::size_t id = device.id();
    if (id >= devices_.size()) {
        devices_.resize(id + 1, nullptr);
    }
    if (devices_[id] != nullptr) {
        throw core::InvalidStateError("device " + std::to_string(id) + " is already registered");
    }
    devices_[id] = &device;
}

Device& BaseStation::device(std::size_t device_id) const {
    if (device_id >= devices_.size() || devices_[device_id] == nullptr) {
        throw core::OutOfRangeError("unknown device " + std::to_string(device_id));
    }
    return *devices_[device_id];
}

const ResourceBlock& BaseStation::block(std::size_t block_id) const {
    if (block_id >= blocks_.size()) {
        throw core::OutOfRangeError("unknown resource block " + std::to_string(block_id));
    }
    return blocks_[block_id];
}

ResourceBlock& BaseStation::block_at(std::size_t block_id) {
    if (block_id >= blocks_.size()) {
        throw core::OutOfRangeError("unknown resource block " + std::to_string(block_id));
    }
    return blocks_[block_id];
}

std::optional<std::size_t> BaseStation::first_free_block() const noexcept {
    for (const auto& rb : blocks_) {
        if (rb.is_free()) {
            return rb.id();
        }
    }
    return std::nullopt;
}

void BaseStation::dispatch(Device& device, Packet packet) {
    if (&this->device(device.id()) != &device) {
        throw core::InvalidStateError("device " + std::to_string(device.id()) +
                                      " is not registered with this base station");
    }

    const core::TimePoint now = engine_.time();
    packet.set_dispatch_key(policy_->dispatch_key(packet, device, now));

    engine_.trace([&](core::TraceWriter& w) {
        w.type("dispatch");
        w.field("device_id", static_cast<uint64_t>(device.id()));
        w.field("packet_id", packet.id());
        w.field("key", packet.dispatch_key());
        w.field("policy", policy_->name());
    });

    if (auto free_block = first_free_block()) {
        start_transmission(*free_block, device, std::move(packet));
        return;
    }

    if (auto victim = policy_->select_victim(packet, blocks_, now)) {
        if (block_at(*victim).is_free()) {
            throw core::InvalidStateError("policy selected free block " +
                                          std::to_string(*victim) + " as preemption victim");
        }
        preempt(*victim, packet);
        start_transmission(*victim, device, std::move(packet));
        return;
    }

    engine_.trace([&](core::TraceWriter& w) {
        w.type("enqueue");
        w.field("device_id", static_cast<uint64_t>(device.id()));
        w.field("packet_id", packet.id());
        w.field("waiting", static_cast<uint64_t>(waiting_.size() + 1));
    });
    waiting_.push(device.id(), std::move(packet));
}

void BaseStation::start_transmission(std::size_t block_id, Device& device, Packet packet) {
    ResourceBlock& rb = block_at(block_id);
    const core::TimePoint now = engine_.time();

    const double sinr = channel_.sinr_db(device.distance(), now);
    rb.set_current_sinr(sinr);

    const double rate = channel_.data_rate(sinr, rb.subcarriers()) * policy_->rate_scale(packet);
    if (!(rate > 0.0)) {
        throw ChannelError("granted rate must be positive");
    }

    uint64_t bits = packet.size_bits();
    const double full_airtime_s = static_cast<double>(bits) / rate;
    core::Duration airtime = core::duration_from_seconds_ceil(full_airtime_s);
    bool partial = false;

    auto quantum = policy_->time_quantum();
    if (quantum && bits > 1 && full_airtime_s > quantum->seconds()) {
        auto per_quantum = static_cast<uint64_t>(std::floor(rate * quantum->seconds()));
        bits = std::clamp<uint64_t>(per_quantum, 1, packet.size_bits() - 1);
        airtime = *quantum;
        partial = true;
    }

    const uint64_t packet_id = packet.id();
    const uint32_t fragment = packet.fragment_index();

    TransmissionHandle handle{device.id(), std::move(packet), now, airtime, rate, bits, partial, {}};
    handle.completion_timer = engine_.add_timer(now + airtime,
                                                [this, block_id] { on_window_end(block_id); });
    rb.bind(std::move(handle));
    ++active_;

    engine_.trace([&](core::TraceWriter& w) {
        w.type("transmission_start");
        w.field("device_id", static_cast<uint64_t>(device.id()));
        w.field("packet_id", packet_id);
        w.field("block", static_cast<uint64_t>(block_id));
        w.field("sinr", sinr);
        w.field("data_rate", rate);
        w.field("airtime", airtime.seconds());
        w.field("bits", bits);
        w.field("fragment", static_cast<uint64_t>(fragment));
    });
}

void BaseStation::on_window_end(std::size_t block_id) {
    ResourceBlock& rb = block_at(block_id);
    rb.occupant().completion_timer.clear();
    if (rb.occupant().partial) {
        end_fragment(block_id);
    } else {
        release(block_id);
    }
}

void BaseStation::release(std::size_t block_id) {
    ResourceBlock& rb = block_at(block_id);
    TransmissionHandle handle = rb.unbind();
    --active_;
    engine_.cancel_timer(handle.completion_timer);

    const core::Duration latency = engine_.time() - handle.packet.creation_time();
    const double sinr = rb.current_sinr();
    const bool success = latency <= handle.packet.max_latency() && channel_.meets_threshold(sinr);

    engine_.trace([&](core::TraceWriter& w) {
        w.type("transmission_end");
        w.field("device_id", static_cast<uint64_t>(handle.device_id));
        w.field("packet_id", handle.packet.id());
        w.field("block", static_cast<uint64_t>(block_id));
        w.field("latency", latency.seconds());
        w.field("sinr", sinr);
    });

    device(handle.device_id).on_transmission_finished(handle.packet, latency, sinr, success);
    serve_waiting();
}

void BaseStation::end_fragment(std::size_t block_id) {
    ResourceBlock& rb = block_at(block_id);
    TransmissionHandle handle = rb.unbind();
    --active_;
    ++fragments_;

    const uint64_t remaining = handle.packet.size_bits() - handle.bits;

    engine_.trace([&](core::TraceWriter& w) {
        w.type("fragment_end");
        w.field("device_id", static_cast<uint64_t>(handle.device_id));
        w.field("packet_id", handle.packet.id());
        w.field("block", static_cast<uint64_t>(block_id));
        w.field("bits", handle.bits);
        w.field("remaining", remaining);
    });

    if (device(handle.device_id).is_pending(handle.packet.id())) {
        waiting_.push(handle.device_id, handle.packet.continuation(remaining));
    }
    serve_waiting();
}

void BaseStation::preempt(std::size_t block_id, const Packet& candidate) {
    ResourceBlock& rb = block_at(block_id);
    TransmissionHandle handle = rb.unbind();
    --active_;
    engine_.cancel_timer(handle.completion_timer);
    ++preemptions_;

    const uint64_t victim_id = handle.packet.id();

    engine_.trace([&](core::TraceWriter& w) {
        w.type("preemption");
        w.field("device_id", static_cast<uint64_t>(handle.device_id));
        w.field("packet_id", victim_id);
        w.field("block", static_cast<uint64_t>(block_id));
        w.field("by_packet_id", candidate.id());
        w.field("by_device_id", static_cast<uint64_t>(candidate.device_id()));
    });

    // A victim already dropped by its deadline guard is simply discarded.
    if (!device(handle.device_id).is_pending(victim_id)) {
        return;
    }

    PendingReentry reentry{handle.device_id, std::move(handle.packet), {}};
    reentry.timer = engine_.add_timer(engine_.time() + params_.preemption_penalty,
                                      [this, victim_id] { on_reentry(victim_id); });
    requeue_.emplace(victim_id, std::move(reentry));
}

void BaseStation::on_reentry(uint64_t packet_id) {
    auto it = requeue_.find(packet_id);
    if (it == requeue_.end()) {
        return;
    }
    it->second.timer.clear();
    PendingReentry reentry = std::move(it->second);
    requeue_.erase(it);

    engine_.trace([&](core::TraceWriter& w) {
        w.type("requeue");
        w.field("device_id", static_cast<uint64_t>(reentry.device_id));
        w.field("packet_id", packet_id);
    });

    waiting_.push(reentry.device_id, std::move(reentry.packet));
    serve_waiting();
}

void BaseStation::serve_waiting() {
    while (!waiting_.empty() && first_free_block()) {
        const core::TimePoint now = engine_.time();
        auto entry = waiting_.pop_next([this, now](const WaitingEntry& e) {
            return policy_->dispatch_key(e.packet, device(e.device_id), now);
        });
        dispatch(device(entry->device_id), std::move(entry->packet));
    }
}

AbandonResult BaseStation::abandon(uint64_t packet_id) {
    AbandonResult result = AbandonResult::NotFound;

    if (waiting_.remove(packet_id)) {
        result = AbandonResult::Waiting;
    } else if (auto it = requeue_.find(packet_id); it != requeue_.end()) {
        engine_.cancel_timer(it->second.timer);
        requeue_.erase(it);
        result = AbandonResult::Requeueing;
    } else {
        bool on_air = std::any_of(blocks_.begin(), blocks_.end(), [packet_id](const ResourceBlock& rb) {
            return !rb.is_free() && rb.occupant().packet.id() == packet_id;
        });
        if (on_air) {
            result = AbandonResult::InFlight;
        }
    }

    if (result == AbandonResult::Waiting || result == AbandonResult::Requeueing) {
        engine_.trace([&](core::TraceWriter& w) {
            w.type("abandon");
            w.field("packet_id", packet_id);
            w.field("from", std::string_view{result == AbandonResult::Waiting ? "waiting" : "requeue"});
        });
    }
    return result;
}

void BaseStation::refresh_sinr() {
    const core::TimePoint now = engine_.time();
    for (auto& rb : blocks_) {
        if (rb.is_free()) {
            continue;
        }
        const TransmissionHandle& handle = rb.occupant();
        const double sinr = channel_.sinr_db(device(handle.device_id).distance(), now);
        rb.set_current_sinr(sinr);

        engine_.trace([&](core::TraceWriter& w) {
            w.type("sinr_update");
            w.field("device_id", static_cast<uint64_t>(handle.device_id));
            w.field("packet_id", handle.packet.id());
            w.field("block", static_cast<uint64_t>(rb.id()));
            w.field("sinr", sinr);
        });
    }
}

} // namespace urllcsim::algo
