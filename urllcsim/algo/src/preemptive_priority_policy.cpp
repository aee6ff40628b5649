#include <urllcsim/algo/preemptive_priority_policy.hpp>

namespace urllcsim::algo {

std::optional<std::size_t>
lowest_priority_victim(const Packet& candidate, std::span<const ResourceBlock> blocks) {
    std::optional<std::size_t> victim;
    int worst_priority = 0;

    for (const auto& block : blocks) {
        if (block.is_free()) {
            continue;
        }
        int priority = block.occupant().packet.static_priority();
        if (!victim || priority > worst_priority) {
            victim = block.id();
            worst_priority = priority;
        }
    }

    if (victim && candidate.static_priority() < worst_priority) {
        return victim;
    }
    return std::nullopt;
}

double PreemptivePriorityPolicy::dispatch_key(const Packet& packet, const Device& /*device*/,
                                              core::TimePoint /*now*/) const {
    return static_cast<double>(packet.static_priority());
}

std::optional<std::size_t>
PreemptivePriorityPolicy::select_victim(const Packet& candidate,
                                        std::span<const ResourceBlock> blocks,
                                        core::TimePoint /*now*/) const {
    return lowest_priority_victim(candidate, blocks);
}

} // namespace urllcsim::algo
