#include <colloc/core/changeset.hpp>
#include <colloc/core/configuration.hpp>
#include <colloc/core/error.hpp>
#include <colloc/core/logging.hpp>
#include <colloc/core/metrics_encoder.hpp>

#include <colloc/io/allocations_loader.hpp>
#include <colloc/io/config_loader.hpp>
#include <colloc/io/error.hpp>
#include <colloc/io/metric_writers.hpp>

#include <cxxopts.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace {

namespace core = colloc::core;
namespace io = colloc::io;

struct Config {
    std::string current_file;
    std::string desired_file;
    std::optional<std::string> config_file;
    std::string format{"json"};
    int cpus{1};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("colloc-reconcile",
                             "Compute target allocations and the minimal changeset to apply");

    // clang-format off
    options.add_options()
        ("c,current", "Allocations in effect (JSON)", cxxopts::value<std::string>())
        ("n,new", "Desired allocations (JSON)", cxxopts::value<std::string>())
        ("config", "Allocation configuration (JSON)", cxxopts::value<std::string>())
        ("cpus", "Logical CPUs used to convert quota fractions (default: 1)",
            cxxopts::value<int>()->default_value("1"))
        ("f,format", "Output format: json|text (default: json)",
            cxxopts::value<std::string>()->default_value("json"))
        ("v,verbose", "Verbose logging to stderr")
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("current") == 0U) {
        std::cerr << "Error: --current is required" << std::endl;
        std::exit(64);
    }
    if (result.count("new") == 0U) {
        std::cerr << "Error: --new is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.current_file = result["current"].as<std::string>();
    config.desired_file = result["new"].as<std::string>();
    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    }
    config.cpus = result["cpus"].as<int>();
    if (config.cpus < 1) {
        std::cerr << "Error: --cpus must be at least 1" << std::endl;
        std::exit(64);
    }
    config.format = result["format"].as<std::string>();
    if (config.format != "json" && config.format != "text") {
        std::cerr << "Error: --format must be 'json' or 'text'" << std::endl;
        std::exit(64);
    }
    config.verbose = result.count("verbose") != 0U;

    return config;
}

const double* scalar_of(const core::AllocationMap& allocations, core::ResourceKind kind) {
    auto it = allocations.find(kind);
    return it == allocations.end() ? nullptr : std::get_if<double>(&it->second);
}

// cgroup values the changeset translates to, for inspection
void write_cgroup_values(const core::WorkloadAllocations& changeset,
                         const core::AllocationConfiguration& allocation_config,
                         int cpus, std::ostream& out) {
    std::map<std::string, const core::AllocationMap*> sorted;
    for (const auto& [workload_id, allocations] : changeset) {
        sorted.emplace(workload_id, &allocations);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    for (const auto& [workload_id, allocations] : sorted) {
        writer.Key(workload_id.c_str(), static_cast<rapidjson::SizeType>(workload_id.size()));
        writer.StartObject();
        // Only scalar values map onto cgroup files
        if (const auto* quota = scalar_of(*allocations, core::ResourceKind::Quota)) {
            writer.Key("cpu.cfs_quota_us");
            writer.Int64(allocation_config.quota(*quota, cpus));
            writer.Key("cpu.cfs_period_us");
            writer.Int64(allocation_config.cpu_quota_period);
        }
        if (const auto* shares = scalar_of(*allocations, core::ResourceKind::Shares)) {
            writer.Key("cpu.shares");
            writer.Int64(allocation_config.shares_count(*shares));
        }
        writer.EndObject();
    }
    writer.EndObject();

    out << buffer.GetString();
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);
        colloc::init_logging(std::nullopt, config.verbose ? std::optional<int>(2) : std::nullopt);

        core::AllocationConfiguration allocation_config;
        if (config.config_file) {
            allocation_config = io::load_allocation_configuration(*config.config_file);
        }

        auto current = io::load_allocations(config.current_file);
        auto desired = io::load_allocations(config.desired_file);
        if (config.verbose) {
            std::cerr << "Loaded " << current.size() << " current and " << desired.size()
                      << " desired workload allocations" << std::endl;
        }

        auto reconciliation = core::reconcile_all(current, desired);
        auto metrics = core::encode_allocations(reconciliation.target);

        if (config.format == "text") {
            io::write_metrics_text(metrics, std::cout);
            return 0;
        }

        std::cout << "{\"target\": ";
        io::write_allocations_to_stream(reconciliation.target, std::cout);
        std::cout << ", \"changeset\": ";
        io::write_allocations_to_stream(reconciliation.changeset, std::cout);
        std::cout << ", \"cgroup_values\": ";
        write_cgroup_values(reconciliation.changeset, allocation_config, config.cpus, std::cout);
        std::cout << ", \"metrics\": ";
        io::write_metrics_to_stream(metrics, std::cout);
        std::cout << "}" << std::endl;

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 65;
    }
    catch (const core::ReconcileError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 65;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
