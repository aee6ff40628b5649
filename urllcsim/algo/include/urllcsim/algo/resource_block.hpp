#pragma once

#include <urllcsim/algo/packet.hpp>

#include <urllcsim/core/timer.hpp>
#include <urllcsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace urllcsim::algo {

/// @brief A packet bound to a resource block for one transmission window.
/// @ingroup algo
///
/// The handle owns the packet while it is on air and holds the completion
/// timer so a preemption can cancel it.
struct TransmissionHandle {
    std::size_t device_id;
    Packet packet;
    core::TimePoint start_time;
    core::Duration airtime;      ///< Committed length of this window.
    double data_rate_bps;
    uint64_t bits;               ///< Bits carried in this window.
    bool partial{false};         ///< True if a continuation follows this window.
    core::TimerId completion_timer;
};

/// @brief One schedulable unit of spectrum with capacity one.
/// @ingroup algo
///
/// A block is either free or bound to exactly one transmission. Blocks
/// live in a contiguous arena owned by the base station and are addressed
/// by index.
class ResourceBlock {
public:
    ResourceBlock(std::size_t id, std::size_t subcarriers, core::Duration slot_duration,
                  double initial_sinr_db = 10.0);

    [[nodiscard]] std::size_t id() const noexcept { return id_; }
    [[nodiscard]] std::size_t subcarriers() const noexcept { return subcarriers_; }
    [[nodiscard]] core::Duration slot_duration() const noexcept { return slot_duration_; }

    [[nodiscard]] double current_sinr() const noexcept { return current_sinr_; }
    void set_current_sinr(double sinr_db) noexcept { current_sinr_ = sinr_db; }

    [[nodiscard]] bool is_free() const noexcept { return !occupant_.has_value(); }

    /// @brief The transmission on this block.
    /// @throws InvalidStateError if the block is free.
    [[nodiscard]] const TransmissionHandle& occupant() const;
    [[nodiscard]] TransmissionHandle& occupant();

    /// @throws InvalidStateError if the block is occupied.
    void bind(TransmissionHandle handle);

    /// @brief Detach and return the current transmission.
    /// @throws InvalidStateError if the block is free.
    TransmissionHandle unbind();

private:
    std::size_t id_;
    std::size_t subcarriers_;
    core::Duration slot_duration_;
    double current_sinr_;
    std::optional<TransmissionHandle> occupant_;
};

} // namespace urllcsim::algo
