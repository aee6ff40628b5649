#pragma once

#include <urllcsim/algo/packet.hpp>
#include <urllcsim/algo/resource_block.hpp>

#include <urllcsim/core/types.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace urllcsim::algo {

class Device;

/// @brief The seven supported scheduling disciplines.
/// @ingroup algo_policies
enum class PolicyKind {
    PreemptivePriority,
    NonPreemptivePriority,
    RoundRobin,
    EarliestDeadlineFirst,
    ProportionalFair,
    HybridEdfPreemptive,
    QciFixedPriority,
};

/// @brief Tunables shared by the policy factory.
/// @ingroup algo_policies
struct PolicyParams {
    /// Round-robin quantum; also the default slot duration of a block.
    core::Duration round_robin_quantum{core::duration_from_seconds(0.000125)};
    /// Hybrid policy switches to slack-based preemption below this urgency.
    core::Duration urgency_threshold{core::duration_from_seconds(0.001)};
    /// Keeps the proportional-fair weight finite for devices with no throughput yet.
    double pf_epsilon{1e-6};
};

/// @brief Strategy deciding dispatch order and preemption.
/// @ingroup algo_policies
///
/// The base station asks the policy for three things:
///   - dispatch_key(): ordering key of a waiting packet, lower served first.
///     Keys are recomputed every time the waiting set is popped, so
///     time-dependent keys (urgency, rolling throughput) are always current.
///     Equal keys fall back to FIFO.
///   - select_victim(): when every block is busy, the block whose
///     transmission should be evicted for @p candidate, or nullopt.
///   - time_quantum() and rate_scale(): how a granted block is used.
///
/// Policies are stateless with respect to the simulation; all state they
/// read comes from the packet, the device and the block arena.
class SchedulingPolicy {
public:
    virtual ~SchedulingPolicy() = default;

    [[nodiscard]] virtual PolicyKind kind() const noexcept = 0;

    /// @brief Canonical configuration name of the policy.
    [[nodiscard]] std::string_view name() const noexcept;

    [[nodiscard]] virtual double dispatch_key(const Packet& packet, const Device& device,
                                              core::TimePoint now) const = 0;

    /// @brief Block to preempt for @p candidate; every block is occupied.
    ///
    /// The default never preempts.
    [[nodiscard]] virtual std::optional<std::size_t>
    select_victim(const Packet& candidate, std::span<const ResourceBlock> blocks,
                  core::TimePoint now) const;

    /// @brief Maximum length of one transmission window, if the policy slices airtime.
    [[nodiscard]] virtual std::optional<core::Duration> time_quantum() const noexcept {
        return std::nullopt;
    }

    /// @brief Multiplier applied to the Shannon rate of a granted block.
    [[nodiscard]] virtual double rate_scale(const Packet& /*packet*/) const noexcept {
        return 1.0;
    }

protected:
    SchedulingPolicy() = default;
    SchedulingPolicy(const SchedulingPolicy&) = default;
    SchedulingPolicy& operator=(const SchedulingPolicy&) = default;
    SchedulingPolicy(SchedulingPolicy&&) = default;
    SchedulingPolicy& operator=(SchedulingPolicy&&) = default;
};

/// @brief Parse a configuration name such as `"edf"` or `"hybrid-edf-preemptive"`.
/// @throws ConfigurationError for an unknown name.
/// @ingroup algo_policies
[[nodiscard]] PolicyKind policy_from_string(std::string_view name);

/// @brief Canonical configuration name of @p kind.
/// @ingroup algo_policies
[[nodiscard]] std::string_view to_string(PolicyKind kind) noexcept;

/// @brief Instantiate the policy of @p kind.
/// @ingroup algo_policies
[[nodiscard]] std::unique_ptr<SchedulingPolicy> make_policy(PolicyKind kind,
                                                            const PolicyParams& params = {});

} // namespace urllcsim::algo
