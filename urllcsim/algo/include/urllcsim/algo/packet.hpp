#pragma once

#include <urllcsim/core/types.hpp>

#include <cstddef>
#include <cstdint>

namespace urllcsim::algo {

/// @brief A unit of uplink data generated by a device.
/// @ingroup algo
///
/// A packet carries its absolute deadline (`creation_time + max_latency`)
/// and the scheduling key the active policy last computed for it. Packets
/// are move-only: exactly one owner exists at any time (the waiting set,
/// a resource block, or the base station's requeue list).
///
/// Round-robin splitting produces continuations: packets that keep the
/// identifier, creation time, deadline and original size of their parent
/// but carry only the bits still to be sent.
class Packet {
public:
    /// @throws PacketError if @p size_bits is zero or @p max_latency is negative.
    Packet(uint64_t id, std::size_t device_id, core::TimePoint creation_time,
           uint64_t size_bits, int static_priority, core::Duration max_latency);

    Packet(const Packet&) = delete;
    Packet& operator=(const Packet&) = delete;
    Packet(Packet&&) = default;
    Packet& operator=(Packet&&) = default;

    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] std::size_t device_id() const noexcept { return device_id_; }
    [[nodiscard]] core::TimePoint creation_time() const noexcept { return creation_time_; }

    /// @brief Bits still to be transmitted.
    [[nodiscard]] uint64_t size_bits() const noexcept { return size_bits_; }

    /// @brief Size at generation time (used for throughput accounting).
    [[nodiscard]] uint64_t original_size_bits() const noexcept { return original_size_bits_; }

    /// @brief Lower value means more important.
    [[nodiscard]] int static_priority() const noexcept { return static_priority_; }

    [[nodiscard]] core::Duration max_latency() const noexcept { return max_latency_; }
    [[nodiscard]] core::TimePoint deadline() const noexcept { return creation_time_ + max_latency_; }

    [[nodiscard]] double dispatch_key() const noexcept { return dispatch_key_; }
    void set_dispatch_key(double key) noexcept { dispatch_key_ = key; }

    /// @brief 0 for a fresh packet, incremented on every continuation.
    [[nodiscard]] uint32_t fragment_index() const noexcept { return fragment_index_; }

    /// @brief Build the continuation that still has to send @p remaining_bits.
    /// @throws PacketError unless 0 < remaining_bits < size_bits().
    [[nodiscard]] Packet continuation(uint64_t remaining_bits) const;

private:
    uint64_t id_;
    std::size_t device_id_;
    core::TimePoint creation_time_;
    uint64_t size_bits_;
    uint64_t original_size_bits_;
    int static_priority_;
    core::Duration max_latency_;
    double dispatch_key_{0.0};
    uint32_t fragment_index_{0};
};

/// @brief Source of globally unique, monotonically increasing packet ids.
/// @ingroup algo
///
/// One generator is shared by all devices of a run so that every packet of
/// the run has a distinct id.
class PacketIdGenerator {
public:
    uint64_t next() noexcept { return next_++; }

    /// @brief Number of ids handed out so far.
    [[nodiscard]] uint64_t issued() const noexcept { return next_ - 1; }

private:
    uint64_t next_{1};
};

} // namespace urllcsim::algo
