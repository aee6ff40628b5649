#include <urllcsim/core/engine.hpp>
#include <urllcsim/core/error.hpp>
#include <urllcsim/core/types.hpp>

#include <urllcsim/algo/error.hpp>
#include <urllcsim/algo/scheduling_policy.hpp>
#include <urllcsim/algo/simulation.hpp>

#include <urllcsim/io/config_loader.hpp>
#include <urllcsim/io/error.hpp>
#include <urllcsim/io/result_writer.hpp>
#include <urllcsim/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace core = urllcsim::core;
namespace algo = urllcsim::algo;
namespace io = urllcsim::io;

constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_CHANNEL_ERROR = 3;
constexpr int EXIT_TRACE_ERROR = 4;
constexpr int EXIT_USAGE = 64;

struct Options {
    std::string config_file;
    std::optional<uint32_t> seed;
    std::optional<std::string> policy;
    double duration{0.0};  // 0 = from config
    std::string output_file;  // empty = no trace
    std::string format{"json"};
    std::string results_file{"-"};
    bool verbose{false};
};

Options parse_args(int argc, char** argv) {
    cxxopts::Options options("urllcsim", "URLLC resource scheduling simulator");

    options.add_options()
        ("c,config", "Simulation configuration (JSON)", cxxopts::value<std::string>())
        ("s,seed", "Run a single seed instead of the configured list", cxxopts::value<uint32_t>())
        ("p,policy", "Override scheduling_policy", cxxopts::value<std::string>())
        ("d,duration", "Override sim_duration in seconds (default: from config)", cxxopts::value<double>()->default_value("0"))
        ("o,output", "Trace output file, '-' for stdout (default: no trace)", cxxopts::value<std::string>()->default_value(""))
        ("format", "Trace format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("r,results", "Results file, '-' for stdout (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("config") == 0U) {
        std::cerr << "Error: --config is required" << std::endl;
        std::exit(EXIT_USAGE);
    }

    Options opts;
    opts.config_file = result["config"].as<std::string>();
    if (result.count("seed") != 0U) {
        opts.seed = result["seed"].as<uint32_t>();
    }
    if (result.count("policy") != 0U) {
        opts.policy = result["policy"].as<std::string>();
    }
    opts.duration = result["duration"].as<double>();
    opts.output_file = result["output"].as<std::string>();
    opts.format = result["format"].as<std::string>();
    opts.results_file = result["results"].as<std::string>();
    opts.verbose = result.count("verbose") != 0U;

    if (opts.format != "json" && opts.format != "text" && opts.format != "null") {
        std::cerr << "Error: unknown trace format: " << opts.format << std::endl;
        std::exit(EXIT_USAGE);
    }
    if (opts.duration < 0.0) {
        std::cerr << "Error: --duration must not be negative" << std::endl;
        std::exit(EXIT_USAGE);
    }
    if (opts.output_file == "-" && opts.results_file == "-" && opts.format != "null") {
        std::cerr << "Error: trace and results cannot both go to stdout" << std::endl;
        std::exit(EXIT_USAGE);
    }

    return opts;
}

// trace.json -> trace_seed_42.json when several seeds share one output name.
std::filesystem::path trace_path_for(const std::string& output, uint32_t seed, bool several) {
    std::filesystem::path path(output);
    if (!several) {
        return path;
    }
    std::filesystem::path renamed = path.parent_path() /
        (path.stem().string() + "_seed_" + std::to_string(seed) + path.extension().string());
    return renamed;
}

// Owns the trace sink of one run.
class TraceSink {
public:
    TraceSink(const Options& opts, uint32_t seed, bool several) {
        if (opts.output_file.empty() || opts.format == "null") {
            writer_ = std::make_unique<io::NullTraceWriter>();
            return;
        }

        std::ostream* out = &std::cout;
        if (opts.output_file != "-") {
            auto path = trace_path_for(opts.output_file, seed, several);
            file_.open(path);
            if (!file_) {
                throw io::TraceWriteError("cannot open trace file " + path.string());
            }
            out = &file_;
        }

        if (opts.format == "text") {
            writer_ = std::make_unique<io::TextualTraceWriter>(*out);
        } else {
            auto json = std::make_unique<io::JsonTraceWriter>(*out);
            json_ = json.get();
            writer_ = std::move(json);
        }
    }

    [[nodiscard]] core::TraceWriter* writer() const noexcept { return writer_.get(); }

    void finish() {
        if (json_ != nullptr) {
            json_->finalize();
        }
    }

private:
    std::ofstream file_;
    std::unique_ptr<core::TraceWriter> writer_;
    io::JsonTraceWriter* json_{nullptr};
};

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto opts = parse_args(argc, argv);

        if (opts.verbose) {
            std::cerr << "Loading configuration from: " << opts.config_file << std::endl;
        }

        algo::SimulationConfig config = io::load_config(opts.config_file);
        if (opts.policy) {
            config.policy = algo::policy_from_string(*opts.policy);
        }
        if (opts.duration > 0.0) {
            config.duration = core::duration_from_seconds(opts.duration);
        }

        std::vector<uint32_t> seeds = config.seeds;
        if (opts.seed) {
            seeds = {*opts.seed};
        }
        const bool several = seeds.size() > 1;

        std::vector<algo::RunResult> results;
        results.reserve(seeds.size());
        for (uint32_t seed : seeds) {
            if (opts.verbose) {
                std::cerr << "Running seed " << seed << " with policy "
                          << algo::to_string(config.policy) << "..." << std::endl;
            }

            TraceSink sink(opts, seed, several);
            results.push_back(algo::run(config, seed, sink.writer()));
            sink.finish();

            if (opts.verbose) {
                const auto& r = results.back();
                std::cerr << "  generated " << r.packets_generated << ", sent " << r.packets_sent
                          << ", dropped " << r.packets_dropped << ", reliability " << r.reliability
                          << std::endl;
            }
        }

        if (opts.results_file == "-") {
            io::write_results(results, std::cout);
        } else {
            io::write_results(results, std::filesystem::path(opts.results_file));
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    }
    catch (const algo::ConfigurationError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    }
    catch (const algo::ChannelError& e) {
        std::cerr << "Channel error: " << e.what() << std::endl;
        return EXIT_CHANNEL_ERROR;
    }
    catch (const io::TraceWriteError& e) {
        std::cerr << "Output error: " << e.what() << std::endl;
        return EXIT_TRACE_ERROR;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return EXIT_USAGE;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
