#include <urllcsim/algo/edf_policy.hpp>

namespace urllcsim::algo {

double EdfPolicy::dispatch_key(const Packet& packet, const Device& /*device*/,
                               core::TimePoint /*now*/) const {
    return core::time_to_seconds(packet.deadline());
}

} // namespace urllcsim::algo
