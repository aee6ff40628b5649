#include <urllcsim/core/race.hpp>
#include <urllcsim/core/error.hpp>

#include <string>

namespace urllcsim::core {

Race::Race(std::size_t arms)
    : arms_(arms) {
    if (arms_ == 0) {
        throw OutOfRangeError("Race needs at least one arm");
    }
}

bool Race::finish(std::size_t arm) {
    if (arm >= arms_) {
        throw OutOfRangeError("Race arm " + std::to_string(arm) + " out of range (" +
                              std::to_string(arms_) + " arms)");
    }
    if (winner_) {
        return false;
    }
    winner_ = arm;
    return true;
}

} // namespace urllcsim::core
