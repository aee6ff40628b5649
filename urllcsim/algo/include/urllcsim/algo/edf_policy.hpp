#pragma once

#include <urllcsim/algo/scheduling_policy.hpp>

namespace urllcsim::algo {

/// @brief Earliest Deadline First over the waiting set, non-preemptive.
/// @ingroup algo_policies
///
/// The key is the absolute deadline in seconds; static priority is ignored.
class EdfPolicy : public SchedulingPolicy {
public:
    [[nodiscard]] PolicyKind kind() const noexcept override {
        return PolicyKind::EarliestDeadlineFirst;
    }

    [[nodiscard]] double dispatch_key(const Packet& packet, const Device& device,
                                      core::TimePoint now) const override;
};

} // namespace urllcsim::algo
