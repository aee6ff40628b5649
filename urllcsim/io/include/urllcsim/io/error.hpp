#pragma once

/// @file error.hpp
/// @brief Exception types of the urllcsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace urllcsim::io {

/// @brief Configuration file could not be read, parsed or validated.
///
/// The message is formatted as `"context: message"`, where the context is
/// the file path, the parse offset or the offending field
/// (e.g. `device_configs[1]`).
///
/// @ingroup io
/// @see load_config, load_config_from_string
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @param message  Human-readable description of the error.
    /// @param context  File path, field name or parse position.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

/// @brief A trace or result sink stopped accepting output.
///
/// Raised as soon as the underlying stream reports a failure; it aborts the
/// run in progress.
///
/// @ingroup io
class TraceWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace urllcsim::io
