#pragma once

#include <urllcsim/algo/scheduling_policy.hpp>

#include <array>

namespace urllcsim::algo {

/// @brief 5G-style fixed priority with QCI-dependent spectral efficiency.
/// @ingroup algo_policies
///
/// The static priority is clamped to a QoS class identifier in [1, 9],
/// which is both the dispatch key and the index into an efficiency table
/// scaling the granted rate. No preemption.
class QciPriorityPolicy : public SchedulingPolicy {
public:
    static constexpr std::array<double, 9> EFFICIENCY{
        1.00, 0.95, 0.90, 0.85, 0.80, 0.75, 0.70, 0.65, 0.60};

    /// @brief QCI of @p packet, in [1, 9].
    [[nodiscard]] static int qci(const Packet& packet) noexcept;

    [[nodiscard]] PolicyKind kind() const noexcept override {
        return PolicyKind::QciFixedPriority;
    }

    [[nodiscard]] double dispatch_key(const Packet& packet, const Device& device,
                                      core::TimePoint now) const override;

    [[nodiscard]] double rate_scale(const Packet& packet) const noexcept override;
};

} // namespace urllcsim::algo
