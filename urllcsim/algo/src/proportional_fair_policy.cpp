#include <urllcsim/algo/proportional_fair_policy.hpp>
#include <urllcsim/algo/device.hpp>
#include <urllcsim/algo/error.hpp>

namespace urllcsim::algo {

ProportionalFairPolicy::ProportionalFairPolicy(double epsilon)
    : epsilon_(epsilon) {
    if (!(epsilon_ > 0.0)) {
        throw ConfigurationError("proportional-fair epsilon must be positive");
    }
}

double ProportionalFairPolicy::dispatch_key(const Packet& packet, const Device& device,
                                            core::TimePoint /*now*/) const {
    return static_cast<double>(packet.static_priority()) /
           (device.average_throughput() + epsilon_);
}

} // namespace urllcsim::algo
