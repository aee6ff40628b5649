#pragma once

#include <urllcsim/algo/scheduling_policy.hpp>

namespace urllcsim::algo {

/// @brief Priority weighted by the device's recent throughput.
/// @ingroup algo_policies
///
/// Key: `static_priority / (average_throughput + epsilon)`, served in
/// ascending order. The average is the device's rolling window of per-packet
/// throughput samples, so the key changes as deliveries complete.
class ProportionalFairPolicy : public SchedulingPolicy {
public:
    /// @throws ConfigurationError if @p epsilon is not positive.
    explicit ProportionalFairPolicy(double epsilon);

    [[nodiscard]] PolicyKind kind() const noexcept override {
        return PolicyKind::ProportionalFair;
    }

    [[nodiscard]] double dispatch_key(const Packet& packet, const Device& device,
                                      core::TimePoint now) const override;

    [[nodiscard]] double epsilon() const noexcept { return epsilon_; }

private:
    double epsilon_;
};

} // namespace urllcsim::algo
