#pragma once

#include <urllcsim/algo/scheduling_policy.hpp>

namespace urllcsim::algo {

/// @brief Time-sliced FIFO service.
/// @ingroup algo_policies
///
/// Every waiting packet has the same key, so service is in arrival order.
/// A packet whose airtime exceeds the quantum transmits for one quantum
/// and the base station requeues a continuation with the remaining bits at
/// the tail of the waiting set.
class RoundRobinPolicy : public SchedulingPolicy {
public:
    /// @throws ConfigurationError if @p quantum is not positive.
    explicit RoundRobinPolicy(core::Duration quantum);

    [[nodiscard]] PolicyKind kind() const noexcept override { return PolicyKind::RoundRobin; }

    [[nodiscard]] double dispatch_key(const Packet& packet, const Device& device,
                                      core::TimePoint now) const override;

    [[nodiscard]] std::optional<core::Duration> time_quantum() const noexcept override {
        return quantum_;
    }

private:
    core::Duration quantum_;
};

} // namespace urllcsim::algo
