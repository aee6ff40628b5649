#pragma once

#include <urllcsim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace urllcsim::core {

/// @brief Sink for structured simulation event records.
/// @ingroup core
///
/// A record is built in four steps: begin() at the current simulated time,
/// type() with the event tag (for example `"transmission_start"` or
/// `"drop"`), any number of field() calls, then end(). Implementations
/// decide the encoding (JSON, aligned text, in-memory buffer).
///
/// The Engine keeps a non-owning pointer to the active writer; with no
/// writer installed, tracing costs one null check.
///
/// @see Engine::set_trace_writer, Engine::trace
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Open a record stamped with @p time.
    virtual void begin(TimePoint time) = 0;

    /// @brief Set the event tag of the open record.
    virtual void type(std::string_view name) = 0;

    virtual void field(std::string_view key, double value) = 0;
    virtual void field(std::string_view key, uint64_t value) = 0;
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief Close the open record.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace urllcsim::core
