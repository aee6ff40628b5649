#pragma once

#include <stdexcept>
#include <string>

namespace urllcsim::core {

/// @brief Base exception for errors raised by the simulation core.
///
/// Callers can catch core failures separately from radio model or I/O
/// errors, which use their own hierarchies.
///
/// @see InvalidStateError, OutOfRangeError
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief An operation is not valid in the object's current state.
///
/// Examples: scheduling a timer before the current simulated time,
/// binding a transmission to a resource block that is already occupied,
/// or registering the same device id twice.
///
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief An index or identifier does not name an existing object.
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace urllcsim::core
