#pragma once

#include <urllcsim/algo/packet.hpp>
#include <urllcsim/algo/resource_block.hpp>
#include <urllcsim/algo/scheduling_policy.hpp>
#include <urllcsim/algo/waiting_set.hpp>

#include <urllcsim/core/timer.hpp>
#include <urllcsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace urllcsim::core {
class Engine;
}

namespace urllcsim::algo {

class ChannelModel;
class Device;

/// @brief Cell configuration.
/// @ingroup algo
struct BaseStationParams {
    std::size_t num_resource_blocks{3};
    std::size_t subcarriers{12};
    core::Duration slot_duration{core::duration_from_seconds(0.000125)};
    /// Delay before an evicted packet re-enters the waiting set.
    core::Duration preemption_penalty{core::duration_from_seconds(0.0001)};
};

/// @brief Where abandon() found the packet.
/// @ingroup algo
enum class AbandonResult {
    NotFound,    ///< Unknown packet (already released or never dispatched).
    Waiting,     ///< Removed from the waiting set.
    Requeueing,  ///< Pending re-entry after preemption was cancelled.
    InFlight,    ///< On air; the transmission runs to completion.
};

/// @brief Admission, dispatch, preemption and release of resource blocks.
/// @ingroup algo
///
/// The base station owns the block arena, the waiting set and the packets
/// serving a preemption penalty. For every packet handed to dispatch():
///   1. if a block is free, the packet is bound to the lowest-indexed one;
///   2. otherwise the policy may name a victim block: the victim's completion
///      timer is cancelled, its packet re-enters the waiting set after the
///      preemption penalty, and the candidate takes the block;
///   3. otherwise the packet joins the waiting set.
///
/// Whenever a block frees up, the waiting packet with the lowest policy key
/// (evaluated at that instant, FIFO on ties) is dispatched.
///
/// The number of occupied blocks never exceeds the number of blocks.
class BaseStation {
public:
    /// @throws ConfigurationError on zero blocks, zero subcarriers, a
    ///         non-positive slot or a negative penalty.
    BaseStation(core::Engine& engine, ChannelModel& channel,
                std::unique_ptr<SchedulingPolicy> policy, BaseStationParams params);

    BaseStation(const BaseStation&) = delete;
    BaseStation& operator=(const BaseStation&) = delete;
    BaseStation(BaseStation&&) = delete;
    BaseStation& operator=(BaseStation&&) = delete;

    /// @brief Make @p device reachable by its id (called by Device itself).
    /// @throws InvalidStateError if the id is already registered.
    void register_device(Device& device);

    /// @throws OutOfRangeError if no device has @p device_id.
    [[nodiscard]] Device& device(std::size_t device_id) const;

    [[nodiscard]] std::size_t device_count() const noexcept { return devices_.size(); }

    /// @brief Admit @p packet from @p device (bind, preempt or enqueue).
    /// @throws ChannelError if the radio model fails for this device.
    void dispatch(Device& device, Packet packet);

    /// @brief Free @p block_id and report the outcome to the owning device.
    ///
    /// The delivery succeeds if the latency is within the packet's budget
    /// and the block's SINR meets the threshold. The next waiting packet is
    /// then dispatched.
    ///
    /// @throws OutOfRangeError for an unknown block, InvalidStateError for a free one.
    void release(std::size_t block_id);

    /// @brief Withdraw a packet whose deadline expired.
    AbandonResult abandon(uint64_t packet_id);

    /// @brief Recompute the SINR of every occupied block.
    ///
    /// Called on interference changes. Committed airtimes are kept.
    void refresh_sinr();

    [[nodiscard]] std::span<const ResourceBlock> blocks() const noexcept { return blocks_; }

    /// @throws OutOfRangeError for an unknown block.
    [[nodiscard]] const ResourceBlock& block(std::size_t block_id) const;

    [[nodiscard]] std::size_t active_transmissions() const noexcept { return active_; }
    [[nodiscard]] std::size_t waiting_count() const noexcept { return waiting_.size(); }
    [[nodiscard]] std::size_t requeue_count() const noexcept { return requeue_.size(); }
    [[nodiscard]] const WaitingSet& waiting() const noexcept { return waiting_; }

    [[nodiscard]] const SchedulingPolicy& policy() const noexcept { return *policy_; }
    [[nodiscard]] const BaseStationParams& params() const noexcept { return params_; }

    [[nodiscard]] uint64_t preemption_count() const noexcept { return preemptions_; }
    [[nodiscard]] uint64_t fragment_count() const noexcept { return fragments_; }

private:
    struct PendingReentry {
        std::size_t device_id;
        Packet packet;
        core::TimerId timer;
    };

    [[nodiscard]] std::optional<std::size_t> first_free_block() const noexcept;
    void start_transmission(std::size_t block_id, Device& device, Packet packet);
    void on_window_end(std::size_t block_id);
    void end_fragment(std::size_t block_id);
    void preempt(std::size_t block_id, const Packet& candidate);
    void on_reentry(uint64_t packet_id);
    void serve_waiting();
    ResourceBlock& block_at(std::size_t block_id);

    core::Engine& engine_;    // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    ChannelModel& channel_;   // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::unique_ptr<SchedulingPolicy> policy_;
    BaseStationParams params_;

    std::vector<ResourceBlock> blocks_;
    std::vector<Device*> devices_;
    WaitingSet waiting_;
    std::map<uint64_t, PendingReentry> requeue_;

    std::size_t active_{0};
    uint64_t preemptions_{0};
    uint64_t fragments_{0};
};

} // namespace urllcsim::algo
