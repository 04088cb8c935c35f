#include "roadfleet/simulation.hpp"
#include "roadfleet/adapters/graph_loader_file.hpp"
#include "roadfleet/adapters/tcp_channel_factory.hpp"
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>
#include <fstream>

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

bool validate(const roadfleet::SimulationConfig& config) {
    const auto& agent = config.agent_params;
    const auto& jam = config.jam_params;

    if (config.num_cars <= 0) {
        spdlog::error("Number of cars must be positive");
        return false;
    }
    if (config.steps < 0 || config.sleep_ms < 0 || config.log_every < 0) {
        spdlog::error("Steps, sleep and log interval must not be negative");
        return false;
    }
    if (agent.dt <= 0.0) {
        spdlog::error("Step duration must be positive");
        return false;
    }
    if (agent.min_speed_factor <= 0.0 || agent.min_speed_factor > agent.max_speed_factor) {
        spdlog::error("Speed factor range must satisfy 0 < min <= max");
        return false;
    }
    if (agent.speed_hold_min < 0 || agent.speed_hold_min > agent.speed_hold_max) {
        spdlog::error("Speed hold range must satisfy 0 <= min <= max");
        return false;
    }
    if (agent.route_cooldown < 0 || agent.reroute_cooldown < 0 || agent.arrival_cooldown < 0 ||
        agent.reroute_every_steps < 0 || agent.report_every < 0) {
        spdlog::error("Cooldowns and intervals must not be negative");
        return false;
    }
    if (jam.probability < 0.0 || jam.probability > 1.0) {
        spdlog::error("Jam probability must be between 0 and 1");
        return false;
    }
    if (jam.min_factor <= 0.0 || jam.min_factor > jam.max_factor || jam.max_factor > 1.0) {
        spdlog::error("Jam factor range must satisfy 0 < min <= max <= 1");
        return false;
    }
    if (jam.min_steps < 1 || jam.min_steps > jam.max_steps) {
        spdlog::error("Jam duration range must satisfy 1 <= min <= max");
        return false;
    }
    return true;
}

void print_summary(const roadfleet::RunSummary& summary, const roadfleet::core::MetricsSnapshot& metrics) {
    spdlog::info("=== Simulation Summary ===");
    spdlog::info("cars_total={} arrived={} driving={} waiting={} failed={}",
                 summary.cars_total, summary.arrived, summary.driving, summary.waiting, summary.failed);
    spdlog::info("avg_drive_steps={:.2f}", summary.avg_drive_steps);
    spdlog::info("avg_wait_steps={:.2f}", summary.avg_wait_steps);
    if (summary.avg_steps_to_arrive) {
        spdlog::info("avg_steps_to_arrive={:.2f}", *summary.avg_steps_to_arrive);
    }
    spdlog::info("Route requests: {} ({} rejected, {} reroutes applied)",
                 metrics.route_requests, metrics.route_rejections, metrics.reroutes_applied);
    spdlog::info("Traffic reports: {} ({} rejected)", metrics.reports_sent, metrics.reports_rejected);
    spdlog::info("Jams started: {}", metrics.jams_started);
    spdlog::info("Wall time: {}ms", metrics.wall_time.count());
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Setup logging
        auto console = spdlog::stdout_color_mt("console");
        spdlog::set_default_logger(console);

        roadfleet::SimulationConfig config;
        roadfleet::adapters::ServerEndpoint endpoint;
        auto& agent = config.agent_params;
        auto& jam = config.jam_params;

        po::options_description general("General");
        general.add_options()
            ("help,h", "Show help message")
            ("config,c", po::value<std::string>(), "Read options from an INI-style file")
            ("verbose,v", "Enable verbose logging")
            ("quiet,q", "Suppress info messages");

        po::options_description run("Simulation");
        run.add_options()
            ("host", po::value<std::string>(&endpoint.host)->default_value("127.0.0.1"), "Routing server host")
            ("port,p", po::value<uint16_t>(&endpoint.port)->default_value(8080), "Routing server port")
            ("timeout", po::value<double>()->default_value(3.0), "Per-operation socket timeout (s)")
            ("protocol", po::value<std::string>()->default_value("line"), "Wire encoding: line | json")
            ("graph-dir,g", po::value<std::string>()->default_value("data"), "Directory with graph.meta and edges.csv")
            ("cars,n", po::value<int>(&config.num_cars)->default_value(10), "Number of cars")
            ("steps", po::value<int>(&config.steps)->default_value(200), "Simulated steps")
            ("dt", po::value<double>(&agent.dt)->default_value(1.0), "Step duration")
            ("report-every", po::value<int>(&agent.report_every)->default_value(5), "Traffic report interval (steps, 0 = off)")
            ("report-position", po::value<bool>(&agent.report_position)->default_value(true), "Include position_on_edge in traffic reports")
            ("sleep-ms", po::value<int>(&config.sleep_ms)->default_value(0), "Pacing delay per step (ms)")
            ("log-every", po::value<int>(&config.log_every)->default_value(10), "Progress log interval (steps, 0 = off)")
            ("seed,s", po::value<uint64_t>(&config.seed)->default_value(1), "Random seed")
            ("out-trace", po::value<std::string>()->default_value(""), "Output step trace CSV file")
            ("out-metrics", po::value<std::string>()->default_value(""), "Output metrics JSON file");

        po::options_description model("Traffic model");
        model.add_options()
            ("min-speed-factor", po::value<double>(&agent.min_speed_factor)->default_value(0.4), "Lower desired speed factor")
            ("max-speed-factor", po::value<double>(&agent.max_speed_factor)->default_value(1.0), "Upper desired speed factor")
            ("speed-hold-min", po::value<int>(&agent.speed_hold_min)->default_value(3), "Min steps a desired speed is held")
            ("speed-hold-max", po::value<int>(&agent.speed_hold_max)->default_value(10), "Max steps a desired speed is held")
            ("route-cooldown-steps", po::value<int>(&agent.route_cooldown)->default_value(0), "Cooldown after a route is adopted")
            ("reroute-cooldown-steps", po::value<int>(&agent.reroute_cooldown)->default_value(3), "Cooldown after a rejected request")
            ("arrival-cooldown-steps", po::value<int>(&agent.arrival_cooldown)->default_value(5), "Cooldown after arrival")
            ("reroute-every", po::value<int>(&agent.reroute_every_steps)->default_value(0), "Mid-route reroute interval (steps, 0 = off)")
            ("jam-prob", po::value<double>(&jam.probability)->default_value(0.02), "Jam start probability")
            ("jam-min-factor", po::value<double>(&jam.min_factor)->default_value(0.2), "Lower jam speed factor")
            ("jam-max-factor", po::value<double>(&jam.max_factor)->default_value(0.6), "Upper jam speed factor")
            ("jam-min-steps", po::value<int>(&jam.min_steps)->default_value(5), "Min jam duration")
            ("jam-max-steps", po::value<int>(&jam.max_steps)->default_value(20), "Max jam duration")
            ("jam-min-cars", po::value<int>(&jam.min_cars)->default_value(3), "Occupancy needed to start a jam");

        po::options_description desc("Road Fleet Simulator - Options");
        desc.add(general).add(run).add(model);

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "Road Fleet Simulator\n";
            std::cout << "Step-synchronized car agents driving against a routing/traffic server\n\n";
            std::cout << desc << "\n";
            std::cout << "Example:\n";
            std::cout << "  ./roadfleet_app --graph-dir data --cars 50 --steps 500 --seed 7 \\\n";
            std::cout << "                  --host 127.0.0.1 --port 8080 --protocol line\n";
            return 0;
        }

        // Command line values were stored first and take precedence
        if (vm.count("config")) {
            fs::path config_path = vm["config"].as<std::string>();
            std::ifstream config_file(config_path);
            if (!config_file) {
                spdlog::error("Cannot open config file: {}", config_path.string());
                return 1;
            }
            po::store(po::parse_config_file(config_file, desc), vm);
        }

        po::notify(vm);

        // Set log level
        if (vm.count("verbose")) {
            spdlog::set_level(spdlog::level::debug);
        } else if (vm.count("quiet")) {
            spdlog::set_level(spdlog::level::warn);
        } else {
            spdlog::set_level(spdlog::level::info);
        }

        auto protocol = roadfleet::adapters::parse_protocol(vm["protocol"].as<std::string>());
        if (!protocol) {
            spdlog::error("Unknown protocol '{}', expected line or json", vm["protocol"].as<std::string>());
            return 1;
        }
        endpoint.protocol = *protocol;

        double timeout_s = vm["timeout"].as<double>();
        if (timeout_s <= 0.0) {
            spdlog::error("Timeout must be positive");
            return 1;
        }
        endpoint.timeout = std::chrono::milliseconds(static_cast<long>(timeout_s * 1000.0));

        config.graph_dir = vm["graph-dir"].as<std::string>();
        config.trace_output = vm["out-trace"].as<std::string>();
        config.metrics_output = vm["out-metrics"].as<std::string>();

        if (!validate(config)) {
            return 1;
        }

        // Create simulation components
        auto graph_loader = std::make_unique<roadfleet::adapters::GraphLoaderFile>();
        auto channels = std::make_unique<roadfleet::adapters::TcpChannelFactory>(endpoint);

        roadfleet::Simulation sim(config, std::move(graph_loader), std::move(channels));

        if (!sim.initialize()) {
            spdlog::error("Failed to initialize simulation");
            return 1;
        }

        spdlog::info("Server {}:{} ({}), seed {}", endpoint.host, endpoint.port,
                     roadfleet::adapters::to_string(endpoint.protocol), config.seed);

        auto summary = sim.run();
        print_summary(summary, sim.get_metrics());
        return 0;

    } catch (const roadfleet::core::SetupError& e) {
        spdlog::error("Simulation aborted: {}", e.what());
        return 1;
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}
