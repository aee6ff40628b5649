#pragma once

#include <urllcsim/core/event.hpp>
#include <urllcsim/core/timer.hpp>
#include <urllcsim/core/trace_writer.hpp>
#include <urllcsim/core/types.hpp>

#include <cstddef>
#include <functional>
#include <map>

namespace urllcsim::core {

/// @brief Discrete-event loop and simulated clock.
///
/// The Engine owns an ordered map of pending events and advances the clock
/// by jumping to the earliest one. All events that share an instant are
/// processed in one timestep, including events added at that same instant
/// while the timestep is running. Time never moves backwards.
///
/// Every simulation activity is expressed as timers: a process that would
/// "sleep for d" schedules a callback at `time() + d` and resumes there.
///
/// The Engine is non-copyable and non-movable. Objects that hold a
/// reference to it (devices, base station, channel) must not outlive it.
///
/// @code
/// core::Engine engine;
/// engine.add_timer(core::time_from_seconds(0.5), [] { ... });
/// engine.run(core::time_from_seconds(10.0));
/// @endcode
///
/// @see TimerId, EventPriority, TraceWriter
/// @ingroup core_engine
class Engine {
public:
    Engine() = default;
    ~Engine() = default;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    /// @brief Current simulated time.
    [[nodiscard]] TimePoint time() const noexcept { return current_time_; }

    /// @brief Run until no event is pending or a stop is requested.
    void run();

    /// @brief Run until @p until, processing every event at that instant.
    ///
    /// The clock is left at @p until even if the queue drained earlier.
    /// Events later than @p until stay pending.
    void run(TimePoint until);

    /// @brief Run until @p stop_condition returns true.
    ///
    /// The condition is evaluated between timesteps.
    void run(std::function<bool()> stop_condition);

    /// @brief Ask the loop to return after the current timestep.
    ///
    /// The flag is reset at the start of every run() call.
    void request_stop() noexcept { stop_requested_ = true; }

    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_; }

    /// @brief Schedule a one-shot callback.
    /// @param when     Absolute firing time; must not be earlier than time().
    /// @param priority Ordering among events of the same instant (lower first).
    /// @param callback Invoked when the timer fires.
    /// @return Handle usable with cancel_timer().
    /// @throws InvalidStateError if @p when is in the past.
    TimerId add_timer(TimePoint when, int priority, std::function<void()> callback);

    /// @brief Schedule a one-shot callback at EventPriority::TIMER_DEFAULT.
    TimerId add_timer(TimePoint when, std::function<void()> callback);

    /// @brief Cancel a pending timer; no-op on an invalid handle.
    /// @param timer_id Reset to invalid on return.
    void cancel_timer(TimerId& timer_id);

    /// @brief Number of events still pending.
    [[nodiscard]] std::size_t pending_events() const noexcept { return event_queue_.size(); }

    /// @brief Number of events dispatched since construction.
    [[nodiscard]] uint64_t processed_events() const noexcept { return processed_events_; }

    /// @brief Install the trace sink (non-owning); nullptr disables tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    [[nodiscard]] TraceWriter* trace_writer() const noexcept { return trace_writer_; }

    /// @brief Emit one trace record if a writer is installed.
    ///
    /// @p func receives the writer after begin() and must set the type and
    /// fields; end() is called afterwards. Nothing is evaluated when
    /// tracing is disabled.
    template<typename F>
    void trace(F&& func);

private:
    void process_timestep();

    TimePoint current_time_{};
    uint64_t sequence_{0};
    uint64_t processed_events_{0};
    bool stop_requested_{false};

    std::map<EventKey, Event> event_queue_;
    TraceWriter* trace_writer_{nullptr};
};

template<typename F>
void Engine::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_time_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace urllcsim::core
