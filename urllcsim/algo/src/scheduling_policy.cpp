#include <urllcsim/algo/scheduling_policy.hpp>
#include <urllcsim/algo/edf_policy.hpp>
#include <urllcsim/algo/error.hpp>
#include <urllcsim/algo/hybrid_edf_policy.hpp>
#include <urllcsim/algo/non_preemptive_priority_policy.hpp>
#include <urllcsim/algo/preemptive_priority_policy.hpp>
#include <urllcsim/algo/proportional_fair_policy.hpp>
#include <urllcsim/algo/qci_priority_policy.hpp>
#include <urllcsim/algo/round_robin_policy.hpp>

#include <string>

namespace urllcsim::algo {

std::string_view SchedulingPolicy::name() const noexcept {
    return to_string(kind());
}

std::optional<std::size_t>
SchedulingPolicy::select_victim(const Packet& /*candidate*/,
                                std::span<const ResourceBlock> /*blocks*/,
                                core::TimePoint /*now*/) const {
    return std::nullopt;
}

PolicyKind policy_from_string(std::string_view name) {
    if (name == "preemptive") {
        return PolicyKind::PreemptivePriority;
    }
    if (name == "non-preemptive") {
        return PolicyKind::NonPreemptivePriority;
    }
    if (name == "round-robin") {
        return PolicyKind::RoundRobin;
    }
    if (name == "edf") {
        return PolicyKind::EarliestDeadlineFirst;
    }
    if (name == "proportional-fair") {
        return PolicyKind::ProportionalFair;
    }
    if (name == "hybrid-edf-preemptive" || name == "hybrid-edf") {
        return PolicyKind::HybridEdfPreemptive;
    }
    if (name == "5g-fixed" || name == "fiveg-fixed") {
        return PolicyKind::QciFixedPriority;
    }
    throw ConfigurationError("unknown scheduling policy '" + std::string(name) + "'");
}

std::string_view to_string(PolicyKind kind) noexcept {
    switch (kind) {
        case PolicyKind::PreemptivePriority:    return "preemptive";
        case PolicyKind::NonPreemptivePriority: return "non-preemptive";
        case PolicyKind::RoundRobin:            return "round-robin";
        case PolicyKind::EarliestDeadlineFirst: return "edf";
        case PolicyKind::ProportionalFair:      return "proportional-fair";
        case PolicyKind::HybridEdfPreemptive:   return "hybrid-edf-preemptive";
        case PolicyKind::QciFixedPriority:      return "5g-fixed";
    }
    return "unknown";
}

std::unique_ptr<SchedulingPolicy> make_policy(PolicyKind kind, const PolicyParams& params) {
    switch (kind) {
        case PolicyKind::PreemptivePriority:
            return std::make_unique<PreemptivePriorityPolicy>();
        case PolicyKind::NonPreemptivePriority:
            return std::make_unique<NonPreemptivePriorityPolicy>();
        case PolicyKind::RoundRobin:
            return std::make_unique<RoundRobinPolicy>(params.round_robin_quantum);
        case PolicyKind::EarliestDeadlineFirst:
            return std::make_unique<EdfPolicy>();
        case PolicyKind::ProportionalFair:
            return std::make_unique<ProportionalFairPolicy>(params.pf_epsilon);
        case PolicyKind::HybridEdfPreemptive:
            return std::make_unique<HybridEdfPolicy>(params.urgency_threshold);
        case PolicyKind::QciFixedPriority:
            return std::make_unique<QciPriorityPolicy>();
    }
    throw ConfigurationError("unhandled scheduling policy");
}

} // namespace urllcsim::algo
