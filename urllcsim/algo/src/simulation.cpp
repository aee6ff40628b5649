#include <urllcsim/algo/simulation.hpp>
#include <urllcsim/algo/metrics.hpp>

#include <urllcsim/core/error.hpp>

#include <string>
#include <utility>

namespace urllcsim::algo {

namespace {

SimulationConfig validated(SimulationConfig config) {
    validate(config);
    return config;
}

} // namespace

Simulation::Simulation(SimulationConfig config, uint32_t seed)
    : config_(validated(std::move(config)))
    , seed_(seed)
    , rng_(seed)
    , channel_(config_.channel)
    , base_station_(engine_, channel_, make_policy(config_.policy, config_.policy_params),
                    config_.base_station) {
    create_devices();
}

void Simulation::create_devices() {
    std::size_t next_id = 0;
    for (const auto& dc : config_.device_classes) {
        for (std::size_t i = 0; i < dc.count; ++i) {
            DeviceParams params;
            params.distance_m = dc.min_distance_m;
            if (dc.max_distance_m > dc.min_distance_m) {
                std::uniform_real_distribution<double> distance(dc.min_distance_m, dc.max_distance_m);
                params.distance_m = distance(rng_);
            }
            params.priority = dc.priorities.front();
            if (dc.priorities.size() > 1) {
                std::uniform_int_distribution<std::size_t> pick(0, dc.priorities.size() - 1);
                params.priority = dc.priorities[pick(rng_)];
            }
            params.arrival_rate = dc.arrival_rate;
            params.packet_size_bits = dc.packet_size_bits;
            params.max_latency = dc.max_latency;
            params.throughput_window = config_.throughput_window;

            devices_.push_back(std::make_unique<Device>(next_id++, params, engine_, base_station_,
                                                        packet_ids_, rng_));
        }
    }
}

Device& Simulation::device(std::size_t index) {
    if (index >= devices_.size()) {
        throw core::OutOfRangeError("unknown device " + std::to_string(index));
    }
    return *devices_[index];
}

RunResult Simulation::run() {
    if (started_) {
        throw core::InvalidStateError("a simulation can only run once");
    }
    started_ = true;

    channel_.start_interference(engine_, rng_, [this] { base_station_.refresh_sinr(); });
    for (auto& dev : devices_) {
        dev->start();
    }

    engine_.run(core::TimePoint::epoch() + config_.duration);

    RunResult result = collect_results();
    trace_summary(result);
    return result;
}

RunResult Simulation::collect_results() const {
    RunResult result;
    result.seed = seed_;
    result.policy = std::string(to_string(config_.policy));
    result.duration_s = config_.duration.seconds();
    result.preemptions = base_station_.preemption_count();
    result.fragments = base_station_.fragment_count();

    const core::TimePoint end = engine_.time();
    std::vector<double> pooled_latencies;
    std::vector<double> throughputs;
    uint64_t delivered_bits = 0;
    uint64_t deadline_misses = 0;
    double aoi_sum = 0.0;

    for (const auto& dev : devices_) {
        DeviceStats stats;
        stats.device_id = dev->id();
        stats.priority = dev->priority();
        stats.distance_m = dev->distance();
        stats.packets_generated = dev->packets_generated();
        stats.packets_sent = dev->packets_sent();
        stats.packets_dropped = dev->packets_dropped();
        stats.deadline_misses = dev->deadline_misses();
        stats.avg_latency = mean(dev->latencies());
        stats.p99_latency = percentile(dev->latencies(), 99.0);
        stats.throughput_bps = static_cast<double>(dev->delivered_bits()) / result.duration_s;
        stats.reliability = dev->reliability();
        stats.aoi = dev->aoi(end);

        pooled_latencies.insert(pooled_latencies.end(), dev->latencies().begin(),
                                dev->latencies().end());
        throughputs.push_back(stats.throughput_bps);
        delivered_bits += dev->delivered_bits();
        deadline_misses += stats.deadline_misses;
        aoi_sum += stats.aoi;
        result.packets_generated += stats.packets_generated;
        result.packets_sent += stats.packets_sent;
        result.packets_dropped += stats.packets_dropped;

        result.per_device_stats.push_back(stats);
    }

    const uint64_t terminal = result.packets_sent + result.packets_dropped;
    result.avg_latency = mean(pooled_latencies);
    result.p99_latency = percentile(std::move(pooled_latencies), 99.0);
    result.total_throughput = static_cast<double>(delivered_bits) / result.duration_s;
    if (terminal > 0) {
        result.reliability = static_cast<double>(result.packets_sent) / static_cast<double>(terminal);
        result.deadline_miss_rate = static_cast<double>(deadline_misses) / static_cast<double>(terminal);
    }
    if (!devices_.empty()) {
        result.avg_aoi = aoi_sum / static_cast<double>(devices_.size());
    }
    result.fairness_index = jain_fairness(throughputs);
    return result;
}

void Simulation::trace_summary(const RunResult& result) {
    for (const auto& stats : result.per_device_stats) {
        engine_.trace([&](core::TraceWriter& w) {
            w.type("device_summary");
            w.field("device_id", static_cast<uint64_t>(stats.device_id));
            w.field("priority", static_cast<uint64_t>(stats.priority));
            w.field("distance", stats.distance_m);
            w.field("sent", stats.packets_sent);
            w.field("dropped", stats.packets_dropped);
            w.field("deadline_misses", stats.deadline_misses);
            w.field("latency", stats.avg_latency);
            w.field("percentile_latency", stats.p99_latency);
            w.field("throughput", stats.throughput_bps);
            w.field("reliability", stats.reliability);
            w.field("aoi", stats.aoi);
        });
    }

    engine_.trace([&](core::TraceWriter& w) {
        w.type("simulation_summary");
        w.field("seed", static_cast<uint64_t>(result.seed));
        w.field("policy", std::string_view{result.policy});
        w.field("latency", result.avg_latency);
        w.field("percentile_latency", result.p99_latency);
        w.field("throughput", result.total_throughput);
        w.field("reliability", result.reliability);
        w.field("deadline_miss_rate", result.deadline_miss_rate);
        w.field("aoi", result.avg_aoi);
        w.field("fairness", result.fairness_index);
        w.field("preemptions", result.preemptions);
    });
}

RunResult run(const SimulationConfig& config, uint32_t seed, core::TraceWriter* writer) {
    Simulation simulation(config, seed);
    simulation.set_trace_writer(writer);
    return simulation.run();
}

} // namespace urllcsim::algo
