#pragma once

#include <cstddef>
#include <optional>

namespace urllcsim::core {

/// @brief First-of-N selection between concurrently armed activities.
///
/// A packet is raced between its transmission and its deadline guard;
/// whichever reports first wins and the other arm's report is ignored.
/// Reports arrive through engine callbacks, so ties at the same instant
/// are decided by EventPriority before they reach the Race.
///
/// @ingroup core_events
class Race {
public:
    /// @param arms Number of competing activities (at least one).
    /// @throws OutOfRangeError if @p arms is zero.
    explicit Race(std::size_t arms);

    /// @brief Report that @p arm finished.
    /// @return True only for the first report; later reports return false.
    /// @throws OutOfRangeError if @p arm is not below arm_count().
    bool finish(std::size_t arm);

    [[nodiscard]] bool settled() const noexcept { return winner_.has_value(); }

    /// @brief Index of the winning arm, if any has finished.
    [[nodiscard]] std::optional<std::size_t> winner() const noexcept { return winner_; }

    [[nodiscard]] std::size_t arm_count() const noexcept { return arms_; }

private:
    std::size_t arms_;
    std::optional<std::size_t> winner_;
};

} // namespace urllcsim::core
