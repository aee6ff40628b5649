#include <urllcsim/io/result_writer.hpp>
#include <urllcsim/io/error.hpp>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <fstream>

namespace urllcsim::io {

namespace {

using Writer = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void write_device(Writer& writer, const algo::DeviceStats& stats) {
    writer.StartObject();
    writer.Key("device_id");
    writer.Uint64(stats.device_id);
    writer.Key("priority");
    writer.Int(stats.priority);
    writer.Key("distance");
    writer.Double(stats.distance_m);
    writer.Key("packets_generated");
    writer.Uint64(stats.packets_generated);
    writer.Key("packets_sent");
    writer.Uint64(stats.packets_sent);
    writer.Key("packets_dropped");
    writer.Uint64(stats.packets_dropped);
    writer.Key("deadline_misses");
    writer.Uint64(stats.deadline_misses);
    writer.Key("latency");
    writer.Double(stats.avg_latency);
    writer.Key("percentile_latency");
    writer.Double(stats.p99_latency);
    writer.Key("throughput");
    writer.Double(stats.throughput_bps);
    writer.Key("reliability");
    writer.Double(stats.reliability);
    writer.Key("aoi");
    writer.Double(stats.aoi);
    writer.EndObject();
}

void write_run(Writer& writer, const algo::RunResult& result) {
    writer.StartObject();
    writer.Key("seed");
    writer.Uint(result.seed);
    writer.Key("policy");
    writer.String(result.policy.c_str(), static_cast<rapidjson::SizeType>(result.policy.size()));
    writer.Key("duration");
    writer.Double(result.duration_s);
    writer.Key("latency");
    writer.Double(result.avg_latency);
    writer.Key("percentile_latency");
    writer.Double(result.p99_latency);
    writer.Key("throughput");
    writer.Double(result.total_throughput);
    writer.Key("reliability");
    writer.Double(result.reliability);
    writer.Key("deadline_miss_rate");
    writer.Double(result.deadline_miss_rate);
    writer.Key("aoi");
    writer.Double(result.avg_aoi);
    writer.Key("fairness");
    writer.Double(result.fairness_index);
    writer.Key("packets_generated");
    writer.Uint64(result.packets_generated);
    writer.Key("packets_sent");
    writer.Uint64(result.packets_sent);
    writer.Key("packets_dropped");
    writer.Uint64(result.packets_dropped);
    writer.Key("preemptions");
    writer.Uint64(result.preemptions);
    writer.Key("fragments");
    writer.Uint64(result.fragments);

    writer.Key("devices");
    writer.StartArray();
    for (const auto& stats : result.per_device_stats) {
        write_device(writer, stats);
    }
    writer.EndArray();
    writer.EndObject();
}

template<typename F>
double average_of(std::span<const algo::RunResult> results, F&& metric) {
    if (results.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& r : results) {
        sum += metric(r);
    }
    return sum / static_cast<double>(results.size());
}

void write_summary(Writer& writer, std::span<const algo::RunResult> results) {
    writer.StartObject();
    writer.Key("runs");
    writer.Uint64(results.size());
    writer.Key("latency");
    writer.Double(average_of(results, [](const auto& r) { return r.avg_latency; }));
    writer.Key("percentile_latency");
    writer.Double(average_of(results, [](const auto& r) { return r.p99_latency; }));
    writer.Key("throughput");
    writer.Double(average_of(results, [](const auto& r) { return r.total_throughput; }));
    writer.Key("reliability");
    writer.Double(average_of(results, [](const auto& r) { return r.reliability; }));
    writer.Key("deadline_miss_rate");
    writer.Double(average_of(results, [](const auto& r) { return r.deadline_miss_rate; }));
    writer.Key("aoi");
    writer.Double(average_of(results, [](const auto& r) { return r.avg_aoi; }));
    writer.Key("fairness");
    writer.Double(average_of(results, [](const auto& r) { return r.fairness_index; }));
    writer.EndObject();
}

} // anonymous namespace

std::string results_to_string(std::span<const algo::RunResult> results) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);

    writer.StartObject();
    writer.Key("runs");
    writer.StartArray();
    for (const auto& result : results) {
        write_run(writer, result);
    }
    writer.EndArray();
    writer.Key("summary");
    write_summary(writer, results);
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

void write_results(std::span<const algo::RunResult> results, std::ostream& out) {
    out << results_to_string(results) << "\n";
    out.flush();
    if (!out) {
        throw TraceWriteError("cannot write results");
    }
}

void write_results(std::span<const algo::RunResult> results, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw TraceWriteError("cannot create results file " + path.string());
    }
    write_results(results, file);
}

} // namespace urllcsim::io
