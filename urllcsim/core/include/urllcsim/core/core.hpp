#pragma once

/// @defgroup core Core Library
/// @brief Discrete-event engine, simulated time, timers and tracing.
///
/// The core library knows nothing about radio: it provides the event loop,
/// the integer-nanosecond clock types, cancellable timers, first-of-N
/// races and the trace sink interface used by the other libraries.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for simulated time.

/// @defgroup core_engine Engine
/// @ingroup core
/// @brief Event loop and timer API.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Event ordering, timer handles and races.

#include <urllcsim/core/types.hpp>
#include <urllcsim/core/error.hpp>
#include <urllcsim/core/event.hpp>
#include <urllcsim/core/timer.hpp>
#include <urllcsim/core/race.hpp>
#include <urllcsim/core/trace_writer.hpp>
#include <urllcsim/core/engine.hpp>
