#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for simulation output.
///
/// A no-op writer, a streaming JSON writer, an in-memory buffer for tests
/// and post-processing, and an aligned human-readable writer.
///
/// @ingroup io_writers

#include <urllcsim/core/trace_writer.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace urllcsim::io {

/// @brief Trace writer that discards every record.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Streams the trace as a JSON array, one object per record.
///
/// Each record looks like
/// `{"time": 0.0012, "type": "delivered", "device_id": 3, ...}` with the
/// time in seconds. The stream is flushed after every record so a trace
/// stays readable up to the last complete record if the run aborts.
/// Call finalize() to close the array; the destructor does it otherwise.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    /// @throws TraceWriteError if the stream is already in a failed state.
    explicit JsonTraceWriter(std::ostream& output);

    /// @brief Calls finalize() if it has not been called.
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    /// @brief Add a string field (JSON-escaped).
    void field(std::string_view key, std::string_view value) override;

    /// @brief Close the current object and flush.
    /// @throws TraceWriteError if the stream failed.
    void end() override;

    /// @brief Write the closing bracket of the array.
    /// @throws TraceWriteError if the stream failed.
    void finalize();

    [[nodiscard]] uint64_t records_written() const noexcept { return records_; }

private:
    void check_stream() const;
    void write_key(std::string_view key);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    uint64_t records_{0};
    bool finalized_{false};
};

/// @brief A single trace record stored in memory.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
struct TraceRecord {
    double time{0.0};   ///< Simulated time of the event (seconds).
    std::string type;   ///< Event tag (e.g. "transmission_start").
    /// @brief Named fields attached to the event.
    std::unordered_map<std::string, std::variant<double, uint64_t, std::string>> fields;

    /// @brief Numeric field as uint64_t.
    /// @throws std::out_of_range if absent, std::bad_variant_access if not an integer.
    [[nodiscard]] uint64_t uint_field(const std::string& key) const {
        return std::get<uint64_t>(fields.at(key));
    }

    /// @throws std::out_of_range if absent, std::bad_variant_access if not a double.
    [[nodiscard]] double double_field(const std::string& key) const {
        return std::get<double>(fields.at(key));
    }

    [[nodiscard]] bool has(const std::string& key) const { return fields.contains(key); }
};

/// @brief Buffers every record in memory.
///
/// Used by tests to inspect the full event sequence of a run.
///
/// @ingroup io_writers
/// @see TraceRecord
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records whose type is @p type, in emission order.
    [[nodiscard]] std::vector<TraceRecord> records_of(std::string_view type) const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable trace, one aligned line per record.
///
/// Format: `[  0.00120] (+   0.00020)                      delivered: device_id = 3, ...`
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit TextualTraceWriter(std::ostream& output);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;

    /// @brief Write the buffered line.
    /// @throws TraceWriteError if the stream failed.
    void end() override;

private:
    void append(std::string_view key, std::string_view value);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    double time_{0.0};
    double last_time_{-1.0};
    std::string tag_;
    std::string fields_;  // ", key = value" pairs of the open record
};

} // namespace urllcsim::io
