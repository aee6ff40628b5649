#pragma once

#include <urllcsim/core/event.hpp>

#include <map>

namespace urllcsim::core {

class Engine;

/// @brief Handle to a pending timer, cancellable in O(1).
/// @ingroup core_events
///
/// Wraps an iterator into the engine's ordered event map. Only the Engine
/// creates valid handles; a default-constructed TimerId is invalid.
///
/// A callback must call clear() on its own handle on entry: the engine
/// erases the event before invoking it, so a later cancel_timer() on an
/// uncleared handle would touch a dead iterator.
///
/// @see Engine::add_timer, Engine::cancel_timer
class TimerId {
    friend class Engine;

public:
    TimerId() = default;

    /// @brief True while the timer has neither fired nor been cancelled.
    [[nodiscard]] bool valid() const noexcept { return valid_; }

    explicit operator bool() const noexcept { return valid_; }

    /// @brief Mark the handle as spent (call first thing in the callback).
    void clear() noexcept { valid_ = false; }

private:
    using Iterator = std::map<EventKey, Event>::iterator;

    TimerId(Iterator it) : it_(it), valid_(true) {}

    Iterator it_{};
    bool valid_{false};
};

} // namespace urllcsim::core
