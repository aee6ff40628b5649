#include <urllcsim/io/trace_writers.hpp>
#include <urllcsim/io/error.hpp>

#include <cstdio>
#include <iomanip>
#include <sstream>
#include <utility>

namespace urllcsim::io {

namespace {

// JSON string body of @p text, without the surrounding quotes.
std::string json_escaped(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[7];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(c));
                    out += code;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string fixed5(double value) {
    std::ostringstream oss;
    oss << std::setw(10) << std::fixed << std::setprecision(5) << value;
    return oss.str();
}

} // namespace

// NullTraceWriter

void NullTraceWriter::begin(core::TimePoint /*time*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// JsonTraceWriter

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output) {
    check_stream();
    output_ << "[\n";
}

JsonTraceWriter::~JsonTraceWriter() {
    if (!finalized_ && output_) {
        output_ << (records_ > 0 ? "\n]\n" : "]\n");
        output_.flush();
    }
}

void JsonTraceWriter::check_stream() const {
    if (!output_) {
        throw TraceWriteError("trace stream is not writable");
    }
}

void JsonTraceWriter::write_key(std::string_view key) {
    output_ << ", \"" << json_escaped(key) << "\": ";
}

void JsonTraceWriter::begin(core::TimePoint time) {
    output_ << (records_ == 0 ? "  " : ",\n  ")
            << "{\"time\": " << std::setprecision(15) << core::time_to_seconds(time);
}

void JsonTraceWriter::type(std::string_view name) {
    write_key("type");
    output_ << '"' << json_escaped(name) << '"';
}

void JsonTraceWriter::field(std::string_view key, double value) {
    write_key(key);
    output_ << std::setprecision(15) << value;
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    write_key(key);
    output_ << value;
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    write_key(key);
    output_ << '"' << json_escaped(value) << '"';
}

void JsonTraceWriter::end() {
    output_ << '}' << std::flush;
    ++records_;
    check_stream();
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    finalized_ = true;
    output_ << (records_ > 0 ? "\n]\n" : "]\n") << std::flush;
    check_stream();
}

// MemoryTraceWriter

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{core::time_to_seconds(time), {}, {}};
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type.assign(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields.insert_or_assign(std::string(key), std::string(value));
}

void MemoryTraceWriter::end() {
    records_.push_back(std::exchange(current_, TraceRecord{}));
}

std::vector<TraceRecord> MemoryTraceWriter::records_of(std::string_view type) const {
    std::vector<TraceRecord> matching;
    for (const auto& record : records_) {
        if (record.type == type) {
            matching.push_back(record);
        }
    }
    return matching;
}

// TextualTraceWriter

TextualTraceWriter::TextualTraceWriter(std::ostream& output)
    : output_(output) {}

void TextualTraceWriter::append(std::string_view key, std::string_view value) {
    fields_ += fields_.empty() ? " " : ", ";
    fields_ += key;
    fields_ += " = ";
    fields_ += value;
}

void TextualTraceWriter::begin(core::TimePoint time) {
    time_ = core::time_to_seconds(time);
    tag_.clear();
    fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    tag_.assign(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    append(key, oss.str());
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    append(key, std::to_string(value));
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    append(key, value);
}

void TextualTraceWriter::end() {
    const bool advanced = last_time_ >= 0.0 && time_ != last_time_;
    const std::string delta = advanced ? "(+" + fixed5(time_ - last_time_) + ")" : "(           )";

    output_ << '[' << fixed5(time_) << "] " << delta << ' '
            << std::setw(20) << std::right << tag_ << ':' << fields_ << '\n';
    last_time_ = time_;

    if (!output_) {
        throw TraceWriteError("trace stream is not writable");
    }
}

} // namespace urllcsim::io
