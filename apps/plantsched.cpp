#include <plantsched/core/catalog.hpp>
#include <plantsched/core/error.hpp>
#include <plantsched/core/routing.hpp>

#include <plantsched/algo/dispatcher.hpp>

#include <plantsched/io/error.hpp>
#include <plantsched/io/metrics.hpp>
#include <plantsched/io/order_loader.hpp>
#include <plantsched/io/plant_loader.hpp>
#include <plantsched/io/schedule_writer.hpp>
#include <plantsched/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace core = plantsched::core;
namespace algo = plantsched::algo;
namespace io = plantsched::io;

struct Config {
    std::string plant_file;   // empty = built-in reference plant
    std::string orders_file;
    std::string format{"text"};
    std::string output_file{"-"};
    std::string trace{"none"};
    std::string trace_output{"-"};
    uint32_t max_attempts{0};
    uint32_t max_days{0};
    bool metrics{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("plantsched", "Production order scheduler for a roofing-sheet plant");

    options.add_options()
        ("p,plant", "Plant description (JSON, default: built-in reference plant)", cxxopts::value<std::string>())
        ("i,orders", "Orders to schedule (JSON)", cxxopts::value<std::string>())
        ("f,format", "Schedule format: text|json (default: text)", cxxopts::value<std::string>()->default_value("text"))
        ("o,output", "Schedule output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("t,trace", "Decision trace: none|text|json (default: none)", cxxopts::value<std::string>()->default_value("none"))
        ("trace-output", "Trace output (default: stderr)", cxxopts::value<std::string>()->default_value("-"))
        ("max-attempts", "Failed days before an order is abandoned (default: number of orders)", cxxopts::value<uint32_t>()->default_value("0"))
        ("max-days", "Working days to simulate at most (default: unbounded)", cxxopts::value<uint32_t>()->default_value("0"))
        ("metrics", "Print per-unit metrics after the schedule")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("orders") == 0U) {
        std::cerr << "Error: --orders is required" << std::endl;
        std::exit(64);
    }

    Config config;
    if (result.count("plant") != 0U) {
        config.plant_file = result["plant"].as<std::string>();
    }
    config.orders_file = result["orders"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.output_file = result["output"].as<std::string>();
    config.trace = result["trace"].as<std::string>();
    config.trace_output = result["trace-output"].as<std::string>();
    config.max_attempts = result["max-attempts"].as<uint32_t>();
    config.max_days = result["max-days"].as<uint32_t>();
    config.metrics = result.count("metrics") != 0U;
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "text" && config.format != "json") {
        std::cerr << "Error: unknown format '" << config.format << "'" << std::endl;
        std::exit(64);
    }
    if (config.trace != "none" && config.trace != "text" && config.trace != "json") {
        std::cerr << "Error: unknown trace format '" << config.trace << "'" << std::endl;
        std::exit(64);
    }

    return config;
}

io::PlantConfig load_plant(const Config& config) {
    if (config.plant_file.empty()) {
        return io::PlantConfig{core::make_reference_catalog(), core::make_reference_routing()};
    }
    return io::load_plant(config.plant_file);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // 1. Load plant and orders
        if (config.verbose) {
            std::cerr << "Loading plant from: "
                      << (config.plant_file.empty() ? "<reference plant>" : config.plant_file)
                      << std::endl;
            std::cerr << "Loading orders from: " << config.orders_file << std::endl;
        }
        io::PlantConfig plant = load_plant(config);
        std::vector<core::Order> orders = io::load_orders(config.orders_file);

        if (config.verbose) {
            std::cerr << "Plant: " << plant.catalog.machine_type_count() << " machine types, "
                      << plant.catalog.unit_count() << " units, "
                      << plant.catalog.constants().operator_pool << " operators" << std::endl;
            std::cerr << "Orders: " << orders.size() << std::endl;
        }

        // 2. Create dispatcher
        algo::DispatcherOptions options;
        options.max_attempts = config.max_attempts;
        options.max_days = config.max_days;
        algo::Dispatcher dispatcher(plant.catalog, plant.routing, options);

        // 3. Setup trace writer
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream trace_file;
        if (config.trace != "none") {
            std::ostream* trace_stream = &std::cerr;
            if (config.trace_output != "-") {
                trace_file.open(config.trace_output);
                if (!trace_file) {
                    std::cerr << "Error: cannot open trace file: " << config.trace_output << std::endl;
                    return 1;
                }
                trace_stream = &trace_file;
            }
            if (config.trace == "json") {
                writer = std::make_unique<io::JsonTraceWriter>(*trace_stream);
            } else {
                writer = std::make_unique<io::TextualTraceWriter>(*trace_stream,
                                                                  config.trace_output == "-");
            }
            dispatcher.set_trace_writer(writer.get());
        }

        // 4. Run
        auto summary = dispatcher.run(orders);

        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        if (config.verbose) {
            std::cerr << "Dispatch complete after " << summary.days_simulated
                      << " working days (last: " << core::day_label(summary.last_day) << ")"
                      << std::endl;
        }

        // 5. Write schedule
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        if (config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }

        if (config.format == "json") {
            io::write_schedule_json(dispatcher.log(), orders, *out);
        } else {
            io::write_schedule_text(dispatcher.log(), orders, *out);
        }

        if (config.metrics) {
            io::write_metrics_text(io::compute_metrics(dispatcher.log(), plant.catalog), std::cerr);
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::PlantError& e) {
        std::cerr << "Plant error: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
