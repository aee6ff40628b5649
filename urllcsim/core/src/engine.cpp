#include <urllcsim/core/engine.hpp>
#include <urllcsim/core/error.hpp>

#include <utility>

namespace urllcsim::core {

void Engine::run() {
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_) {
        process_timestep();
    }
}

void Engine::run(TimePoint until) {
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_) {
        if (event_queue_.begin()->first.time > until) {
            break;
        }
        process_timestep();
    }
    if (!stop_requested_ && current_time_ < until) {
        current_time_ = until;
    }
}

void Engine::run(std::function<bool()> stop_condition) {
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_ && !stop_condition()) {
        process_timestep();
    }
}

TimerId Engine::add_timer(TimePoint when, int priority, std::function<void()> callback) {
    if (when < current_time_) {
        throw InvalidStateError("Timer must not be scheduled in the past (when >= time())");
    }

    EventKey key{when, priority, sequence_++};
    auto [it, inserted] = event_queue_.emplace(key, Event{std::move(callback)});
    return TimerId(it);
}

TimerId Engine::add_timer(TimePoint when, std::function<void()> callback) {
    return add_timer(when, EventPriority::TIMER_DEFAULT, std::move(callback));
}

void Engine::cancel_timer(TimerId& timer_id) {
    if (!timer_id.valid_) {
        return;
    }
    event_queue_.erase(timer_id.it_);
    timer_id.clear();
}

void Engine::process_timestep() {
    TimePoint timestep = event_queue_.begin()->first.time;
    current_time_ = timestep;

    // Events added at this same instant by a callback are picked up here too.
    while (!event_queue_.empty()) {
        auto it = event_queue_.begin();
        if (it->first.time != timestep) {
            break;
        }

        Event event = std::move(it->second);
        event_queue_.erase(it);
        ++processed_events_;

        if (event.callback) {
            event.callback();
        }
    }
}

} // namespace urllcsim::core
