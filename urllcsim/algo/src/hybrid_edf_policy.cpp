#include <urllcsim/algo/hybrid_edf_policy.hpp>
#include <urllcsim/algo/preemptive_priority_policy.hpp>

namespace urllcsim::algo {

HybridEdfPolicy::HybridEdfPolicy(core::Duration urgency_threshold)
    : urgency_threshold_(urgency_threshold) {}

double HybridEdfPolicy::dispatch_key(const Packet& packet, const Device& /*device*/,
                                     core::TimePoint now) const {
    return (packet.deadline() - now).seconds();
}

std::optional<std::size_t>
HybridEdfPolicy::select_victim(const Packet& candidate, std::span<const ResourceBlock> blocks,
                               core::TimePoint now) const {
    const core::Duration urgency = candidate.deadline() - now;
    if (urgency >= urgency_threshold_) {
        return lowest_priority_victim(candidate, blocks);
    }

    std::optional<std::size_t> victim;
    core::Duration most_slack;
    for (const auto& block : blocks) {
        if (block.is_free()) {
            continue;
        }
        core::Duration slack = block.occupant().packet.deadline() - now;
        if (!victim || slack > most_slack) {
            victim = block.id();
            most_slack = slack;
        }
    }
    if (victim && most_slack > urgency) {
        return victim;
    }
    return std::nullopt;
}

} // namespace urllcsim::algo
