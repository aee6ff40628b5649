#pragma once

#include <urllcsim/algo/scheduling_policy.hpp>

namespace urllcsim::algo {

/// @brief Urgency-ordered dispatch with two preemption regimes.
/// @ingroup algo_policies
///
/// Waiting packets are ordered by urgency, the time left until their
/// deadline evaluated when the waiting set is popped.
///
/// On arrival to a full cell:
///   - if the candidate's urgency is below the threshold, it evicts the
///     transmission with the most slack (latest deadline), lowest block
///     index on ties, provided that slack exceeds the candidate's own
///     urgency; an occupant at least as urgent is never evicted;
///   - otherwise the static-priority rule of PreemptivePriorityPolicy applies.
class HybridEdfPolicy : public SchedulingPolicy {
public:
    explicit HybridEdfPolicy(core::Duration urgency_threshold);

    [[nodiscard]] PolicyKind kind() const noexcept override {
        return PolicyKind::HybridEdfPreemptive;
    }

    [[nodiscard]] double dispatch_key(const Packet& packet, const Device& device,
                                      core::TimePoint now) const override;

    [[nodiscard]] std::optional<std::size_t>
    select_victim(const Packet& candidate, std::span<const ResourceBlock> blocks,
                  core::TimePoint now) const override;

    [[nodiscard]] core::Duration urgency_threshold() const noexcept { return urgency_threshold_; }

private:
    core::Duration urgency_threshold_;
};

} // namespace urllcsim::algo
