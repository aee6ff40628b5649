#include <urllcsim/io/config_loader.hpp>
#include <urllcsim/io/error.hpp>

#include <urllcsim/algo/channel_model.hpp>
#include <urllcsim/algo/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace urllcsim::io {

namespace {

using namespace urllcsim::core;

double get_double_or(const rapidjson::Value& obj, const char* name, double default_val,
                     const std::string& context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    const auto& member = obj[name];
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

Duration get_seconds_or(const rapidjson::Value& obj, const char* name, Duration default_val,
                        const std::string& context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    double seconds = get_double_or(obj, name, 0.0, context);
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative time", context);
    }
    return duration_from_seconds(seconds);
}

// Counts and sizes may be written as 512.0 (e.g. a halved packet size).
uint64_t get_count_or(const rapidjson::Value& obj, const char* name, uint64_t default_val,
                      const std::string& context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    const auto& member = obj[name];
    if (member.IsUint64()) {
        return member.GetUint64();
    }
    if (member.IsNumber()) {
        double value = member.GetDouble();
        if (value >= 0.0 && std::floor(value) == value && value < 1.8e19) {
            return static_cast<uint64_t>(value);
        }
    }
    throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
}

std::optional<double> get_nullable_double(const rapidjson::Value& obj, const char* name,
                                          std::optional<double> default_val,
                                          const std::string& context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    const auto& member = obj[name];
    if (member.IsNull()) {
        return std::nullopt;
    }
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number or null", context);
    }
    return member.GetDouble();
}

int to_priority(const rapidjson::Value& value, const std::string& context) {
    if (!value.IsInt()) {
        throw LoaderError("priority must be an integer", context);
    }
    return value.GetInt();
}

// Accepts a single integer or an array of integers.
std::vector<int> get_priorities_or(const rapidjson::Value& obj, const char* name,
                                   const std::vector<int>& default_val, const std::string& context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    const auto& member = obj[name];
    std::vector<int> result;
    if (member.IsArray()) {
        for (rapidjson::SizeType i = 0; i < member.Size(); ++i) {
            result.push_back(to_priority(member[i], context + "." + name + "[" + std::to_string(i) + "]"));
        }
    } else {
        result.push_back(to_priority(member, context + "." + name));
    }
    return result;
}

void parse_population(algo::SimulationConfig& config, const rapidjson::Document& doc) {
    algo::DeviceClass homogeneous;
    homogeneous.count = get_count_or(doc, "num_devices", homogeneous.count, "config");
    homogeneous.arrival_rate = get_double_or(doc, "arrival_rate", homogeneous.arrival_rate, "config");
    homogeneous.packet_size_bits = get_count_or(doc, "packet_size", homogeneous.packet_size_bits, "config");
    homogeneous.priorities = get_priorities_or(doc, "priority_levels", homogeneous.priorities, "config");
    homogeneous.max_latency = get_seconds_or(doc, "max_latency", homogeneous.max_latency, "config");
    homogeneous.min_distance_m = get_double_or(doc, "min_distance", homogeneous.min_distance_m, "config");
    homogeneous.max_distance_m = get_double_or(doc, "max_distance", homogeneous.max_distance_m, "config");

    if (!doc.HasMember("device_configs")) {
        config.device_classes = {homogeneous};
        return;
    }

    const auto& classes = doc["device_configs"];
    if (!classes.IsArray()) {
        throw LoaderError("field 'device_configs' must be an array", "config");
    }

    config.device_classes.clear();
    for (rapidjson::SizeType i = 0; i < classes.Size(); ++i) {
        const auto& obj = classes[i];
        const std::string ctx = "device_configs[" + std::to_string(i) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("device class must be an object", ctx);
        }

        // Unset fields inherit the homogeneous values.
        algo::DeviceClass dc = homogeneous;
        dc.count = get_count_or(obj, "count", 1, ctx);
        dc.arrival_rate = get_double_or(obj, "arrival_rate", dc.arrival_rate, ctx);
        dc.packet_size_bits = get_count_or(obj, "packet_size", dc.packet_size_bits, ctx);
        dc.priorities = get_priorities_or(obj, "priority", dc.priorities, ctx);
        dc.max_latency = get_seconds_or(obj, "max_latency", dc.max_latency, ctx);
        dc.min_distance_m = get_double_or(obj, "min_distance", dc.min_distance_m, ctx);
        dc.max_distance_m = get_double_or(obj, "max_distance", dc.max_distance_m, ctx);
        config.device_classes.push_back(std::move(dc));
    }
}

void parse_base_station(algo::SimulationConfig& config, const rapidjson::Document& doc) {
    auto& bs = config.base_station;
    bs.num_resource_blocks = get_count_or(doc, "num_resource_blocks", bs.num_resource_blocks, "config");
    bs.subcarriers = get_count_or(doc, "subcarriers", bs.subcarriers, "config");
    bs.slot_duration = get_seconds_or(doc, "slot_duration", bs.slot_duration, "config");
    bs.preemption_penalty = get_seconds_or(doc, "preemption_penalty", bs.preemption_penalty, "config");

    if (doc.HasMember("scheduling_policy")) {
        const auto& name = doc["scheduling_policy"];
        if (!name.IsString()) {
            throw LoaderError("field 'scheduling_policy' must be a string", "config");
        }
        try {
            config.policy = algo::policy_from_string(std::string_view{name.GetString(), name.GetStringLength()});
        } catch (const algo::ConfigurationError& e) {
            throw LoaderError(e.what(), "config.scheduling_policy");
        }
    }

    auto& pp = config.policy_params;
    pp.round_robin_quantum = get_seconds_or(doc, "round_robin_quantum", bs.slot_duration, "config");
    pp.urgency_threshold = get_seconds_or(doc, "urgency_threshold", pp.urgency_threshold, "config");
    pp.pf_epsilon = get_double_or(doc, "pf_epsilon", pp.pf_epsilon, "config");
    config.throughput_window = get_count_or(doc, "pf_window", config.throughput_window, "config");
}

void parse_channel(algo::SimulationConfig& config, const rapidjson::Document& doc) {
    auto& ch = config.channel;
    ch.tx_power_dbm = get_double_or(doc, "transmission_power", ch.tx_power_dbm, "config");
    ch.noise_psd_dbm_per_hz = get_double_or(doc, "noise_power", ch.noise_psd_dbm_per_hz, "config");
    ch.path_loss_exponent = get_double_or(doc, "path_loss_exponent", ch.path_loss_exponent, "config");
    ch.noise_bandwidth_hz = get_double_or(doc, "noise_bandwidth", ch.noise_bandwidth_hz, "config");
    ch.subcarrier_bandwidth_hz = get_double_or(doc, "subcarrier_bandwidth", ch.subcarrier_bandwidth_hz, "config");
    ch.max_data_rate_bps = get_nullable_double(doc, "data_rate_base", ch.max_data_rate_bps, "config");

    ch.interference_rate = get_double_or(doc, "interference_rate", ch.interference_rate, "config");
    ch.interference_duration = get_seconds_or(doc, "interference_duration", ch.interference_duration, "config");
    ch.initial_interference_dbm = get_double_or(doc, "initial_interference", ch.initial_interference_dbm, "config");
    if (doc.HasMember("interference_range")) {
        const auto& range = doc["interference_range"];
        if (!range.IsArray() || range.Size() != 2 || !range[0].IsNumber() || !range[1].IsNumber()) {
            throw LoaderError("field 'interference_range' must be [min_dbm, max_dbm]", "config");
        }
        ch.interference_min_dbm = range[0].GetDouble();
        ch.interference_max_dbm = range[1].GetDouble();
    }

    ch.sinr_floor_db = get_nullable_double(doc, "sinr_floor", ch.sinr_floor_db, "config");
    ch.sinr_threshold_db = get_double_or(doc, "sinr_threshold", ch.sinr_threshold_db, "config");

    if (doc.HasMember("time_varying_channel")) {
        const auto& tv = doc["time_varying_channel"];
        if (tv.IsNull()) {
            ch.variation.reset();
        } else if (tv.IsObject()) {
            algo::PathLossVariation variation;
            variation.period_s = get_double_or(tv, "period", variation.period_s, "config.time_varying_channel");
            variation.amplitude = get_double_or(tv, "amplitude", variation.amplitude, "config.time_varying_channel");
            ch.variation = variation;
        } else {
            throw LoaderError("field 'time_varying_channel' must be an object or null", "config");
        }
    }
}

void parse_seeds(algo::SimulationConfig& config, const rapidjson::Document& doc) {
    if (!doc.HasMember("random_seeds")) {
        return;
    }
    const auto& seeds = doc["random_seeds"];
    if (!seeds.IsArray() || seeds.Empty()) {
        throw LoaderError("field 'random_seeds' must be a non-empty array", "config");
    }
    config.seeds.clear();
    for (rapidjson::SizeType i = 0; i < seeds.Size(); ++i) {
        if (!seeds[i].IsUint()) {
            throw LoaderError("seed must be a 32-bit unsigned integer",
                              "random_seeds[" + std::to_string(i) + "]");
        }
        config.seeds.push_back(seeds[i].GetUint());
    }
}

void parse_config_impl(algo::SimulationConfig& config, const rapidjson::Document& doc) {
    config.duration = get_seconds_or(doc, "sim_duration", config.duration, "config");
    parse_population(config, doc);
    parse_base_station(config, doc);
    parse_channel(config, doc);
    parse_seeds(config, doc);

    try {
        algo::validate(config);
        // Radio parameters are checked by the model itself.
        algo::ChannelModel probe(config.channel);
    } catch (const algo::ConfigurationError& e) {
        throw LoaderError(e.what(), "config");
    }
}

} // anonymous namespace

algo::SimulationConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    try {
        return load_config_from_string(oss.str());
    } catch (const LoaderError& e) {
        throw LoaderError(e.what(), path.string());
    }
}

algo::SimulationConfig load_config_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "config");
    }

    algo::SimulationConfig config;
    parse_config_impl(config, doc);
    return config;
}

} // namespace urllcsim::io
