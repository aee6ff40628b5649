#include <urllcsim/algo/non_preemptive_priority_policy.hpp>

namespace urllcsim::algo {

double NonPreemptivePriorityPolicy::dispatch_key(const Packet& packet, const Device& /*device*/,
                                                 core::TimePoint /*now*/) const {
    return static_cast<double>(packet.static_priority());
}

} // namespace urllcsim::algo
