#include <urllcsim/algo/round_robin_policy.hpp>
#include <urllcsim/algo/error.hpp>

namespace urllcsim::algo {

RoundRobinPolicy::RoundRobinPolicy(core::Duration quantum)
    : quantum_(quantum) {
    if (quantum_ <= core::Duration::zero()) {
        throw ConfigurationError("round-robin quantum must be positive");
    }
}

double RoundRobinPolicy::dispatch_key(const Packet& /*packet*/, const Device& /*device*/,
                                      core::TimePoint /*now*/) const {
    return 0.0;
}

} // namespace urllcsim::algo
