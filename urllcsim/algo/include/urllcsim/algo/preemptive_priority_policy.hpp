#pragma once

#include <urllcsim/algo/scheduling_policy.hpp>

namespace urllcsim::algo {

/// @brief Block carrying the least important transmission, if @p candidate outranks it.
///
/// Returns the block whose occupant has the numerically largest static
/// priority (lowest block index on ties) when @p candidate's priority is
/// strictly smaller; nullopt otherwise.
///
/// @ingroup algo_policies
[[nodiscard]] std::optional<std::size_t>
lowest_priority_victim(const Packet& candidate, std::span<const ResourceBlock> blocks);

/// @brief Static priority with preemption.
/// @ingroup algo_policies
///
/// Waiting packets are served by static priority (lower first, FIFO among
/// equals). A packet arriving to a full cell evicts the least important
/// ongoing transmission if it is strictly more important.
class PreemptivePriorityPolicy : public SchedulingPolicy {
public:
    [[nodiscard]] PolicyKind kind() const noexcept override {
        return PolicyKind::PreemptivePriority;
    }

    [[nodiscard]] double dispatch_key(const Packet& packet, const Device& device,
                                      core::TimePoint now) const override;

    [[nodiscard]] std::optional<std::size_t>
    select_victim(const Packet& candidate, std::span<const ResourceBlock> blocks,
                  core::TimePoint now) const override;
};

} // namespace urllcsim::algo
