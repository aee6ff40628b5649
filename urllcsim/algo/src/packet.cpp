#include <urllcsim/algo/packet.hpp>
#include <urllcsim/algo/error.hpp>

namespace urllcsim::algo {

Packet::Packet(uint64_t id, std::size_t device_id, core::TimePoint creation_time,
               uint64_t size_bits, int static_priority, core::Duration max_latency)
    : id_(id)
    , device_id_(device_id)
    , creation_time_(creation_time)
    , size_bits_(size_bits)
    , original_size_bits_(size_bits)
    , static_priority_(static_priority)
    , max_latency_(max_latency) {
    if (size_bits_ == 0) {
        throw PacketError(id_, "size must be positive");
    }
    if (max_latency_ < core::Duration::zero()) {
        throw PacketError(id_, "latency budget must not be negative");
    }
}

Packet Packet::continuation(uint64_t remaining_bits) const {
    if (remaining_bits == 0 || remaining_bits >= size_bits_) {
        throw PacketError(id_, "continuation must carry fewer bits than its parent");
    }
    Packet next(id_, device_id_, creation_time_, remaining_bits, static_priority_, max_latency_);
    next.original_size_bits_ = original_size_bits_;
    next.dispatch_key_ = dispatch_key_;
    next.fragment_index_ = fragment_index_ + 1;
    return next;
}

} // namespace urllcsim::algo
