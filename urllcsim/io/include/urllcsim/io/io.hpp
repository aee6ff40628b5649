#pragma once

/// @defgroup io I/O Library
/// @brief JSON configuration, trace output and result serialization.
///
/// The I/O library handles every external data format: loading the JSON
/// simulation configuration, writing simulation traces (JSON, textual,
/// in-memory) and serializing run results. Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief JSON configuration loader.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory and null trace writers.

/// @defgroup io_results Results
/// @ingroup io
/// @brief Run result serialization.

#include <urllcsim/io/error.hpp>
#include <urllcsim/io/trace_writers.hpp>
#include <urllcsim/io/config_loader.hpp>
#include <urllcsim/io/result_writer.hpp>
