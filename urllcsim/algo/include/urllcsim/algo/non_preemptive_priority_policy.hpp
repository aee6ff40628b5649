#pragma once

#include <urllcsim/algo/scheduling_policy.hpp>

namespace urllcsim::algo {

/// @brief Static priority without preemption.
/// @ingroup algo_policies
///
/// Ongoing transmissions always run to completion; waiting packets are
/// served by static priority, FIFO among equals.
class NonPreemptivePriorityPolicy : public SchedulingPolicy {
public:
    [[nodiscard]] PolicyKind kind() const noexcept override {
        return PolicyKind::NonPreemptivePriority;
    }

    [[nodiscard]] double dispatch_key(const Packet& packet, const Device& device,
                                      core::TimePoint now) const override;
};

} // namespace urllcsim::algo
