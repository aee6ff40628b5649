#pragma once

#include <urllcsim/core/types.hpp>

#include <compare>
#include <cstdint>
#include <functional>

namespace urllcsim::core {

/// @brief Deterministic ordering key for pending events.
///
/// Events fire by simulated time, then by priority (lower first), then by
/// insertion sequence. The sequence number makes wake-ups scheduled for the
/// same instant and priority resume in the order they were scheduled.
///
/// @see EventPriority, Engine::add_timer
/// @ingroup core_events
struct EventKey {
    TimePoint time;      ///< Simulated instant at which the event fires.
    int priority;        ///< Lower values fire first within an instant.
    uint64_t sequence;   ///< Insertion order.

    /// @cond INTERNAL
    auto operator<=>(const EventKey&) const = default;
    /// @endcond
};

/// @brief Named priorities for events that share an instant.
///
/// Every process wake-up (arrivals, transmission completions, requeue
/// re-entries, interference changes) uses TIMER_DEFAULT and therefore
/// resumes in FIFO order. Deadline guards fire after everything else at
/// the same instant, so a transmission that ends exactly on its deadline
/// is delivered rather than dropped.
///
/// @ingroup core_events
struct EventPriority {
    static constexpr int TIMER_DEFAULT   = 0;
    static constexpr int DEADLINE_EXPIRY = 100;
};

/// @brief A pending one-shot callback.
/// @ingroup core_events
struct Event {
    std::function<void()> callback;
};

} // namespace urllcsim::core
