#include <urllcsim/algo/qci_priority_policy.hpp>

#include <algorithm>

namespace urllcsim::algo {

int QciPriorityPolicy::qci(const Packet& packet) noexcept {
    return std::clamp(packet.static_priority(), 1, 9);
}

double QciPriorityPolicy::dispatch_key(const Packet& packet, const Device& /*device*/,
                                       core::TimePoint /*now*/) const {
    return static_cast<double>(qci(packet));
}

double QciPriorityPolicy::rate_scale(const Packet& packet) const noexcept {
    return EFFICIENCY[static_cast<std::size_t>(qci(packet) - 1)];
}

} // namespace urllcsim::algo
