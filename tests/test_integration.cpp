#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "roadfleet/simulation.hpp"
#include "roadfleet/adapters/graph_loader_file.hpp"
#include "fakes.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using roadfleet::testing::FakeChannelFactory;
using roadfleet::testing::make_line_catalog;

namespace {

roadfleet::SimulationConfig base_config(int num_cars, int steps, uint64_t seed) {
    roadfleet::SimulationConfig config;
    config.catalog = make_line_catalog(8);
    config.num_cars = num_cars;
    config.steps = steps;
    config.seed = seed;
    config.log_every = 0;
    return config;
}

struct AgentOutcome {
    roadfleet::core::CarState state;
    std::vector<roadfleet::core::EdgeId> route;
    std::size_t edge_index;
    double position;
    int drive_steps;
    int wait_steps;
    std::optional<roadfleet::core::Step> arrival_step;

    bool operator==(const AgentOutcome&) const = default;
};

std::vector<AgentOutcome> outcomes(const roadfleet::Simulation& sim) {
    std::vector<AgentOutcome> result;
    for (const auto& agent : sim.get_agents()) {
        result.push_back({agent.state(), agent.route(), agent.current_edge_index(),
                          agent.position_on_edge(), agent.total_drive_steps(),
                          agent.total_wait_steps(), agent.arrival_step()});
    }
    return result;
}

} // namespace

TEST_CASE("End-to-end simulation", "[integration]") {
    SECTION("Basic run completes every step") {
        auto config = base_config(6, 200, 42);
        auto factory = std::make_unique<FakeChannelFactory>(*config.catalog);
        auto* channels = factory.get();

        roadfleet::Simulation sim(config, std::move(factory));
        REQUIRE(sim.initialize());
        auto summary = sim.run();

        REQUIRE(channels->connects() == 6);
        REQUIRE(summary.cars_total == 6);
        REQUIRE(summary.steps_completed == 200);
        REQUIRE(summary.failed == 0);
        REQUIRE(summary.arrived > 0);
        REQUIRE(summary.avg_steps_to_arrive.has_value());
        REQUIRE(summary.driving + summary.waiting <= summary.cars_total);
        REQUIRE_THAT(summary.avg_drive_steps + summary.avg_wait_steps, Catch::Matchers::WithinAbs(200.0, 1e-9));

        auto traces = sim.get_traces();
        REQUIRE(traces.size() == 200);
        const auto& last = traces.back();
        REQUIRE(last.step == 199);
        REQUIRE(last.driving + last.arrived + last.waiting + last.failed == 6);

        auto metrics = sim.get_metrics();
        REQUIRE(metrics.steps_completed == 200);
        REQUIRE(metrics.route_requests > 0);
        REQUIRE(metrics.reports_sent > 0);
        REQUIRE(metrics.agent_failures == 0);
    }

    SECTION("Graph loaded from files") {
        fs::path dir = fs::temp_directory_path() / "roadfleet_integration_graph";
        fs::remove_all(dir);
        fs::create_directories(dir);
        std::ofstream(dir / "graph.meta") << "num_nodes 3\nnum_edges 4\n";
        std::ofstream(dir / "edges.csv")
            << "edge_id,from_node,to_node,base_length,base_speed_limit\n"
            << "0,0,1,20,5\n1,1,0,20,5\n2,1,2,20,5\n3,2,1,20,5\n";

        roadfleet::SimulationConfig config;
        config.graph_dir = dir;
        config.num_cars = 3;
        config.steps = 60;
        config.log_every = 0;

        auto catalog = roadfleet::adapters::GraphLoaderFile().load(dir);
        REQUIRE(catalog.has_value());

        roadfleet::Simulation sim(config,
                                  std::make_unique<roadfleet::adapters::GraphLoaderFile>(),
                                  std::make_unique<FakeChannelFactory>(*catalog));
        REQUIRE(sim.initialize());
        REQUIRE(sim.get_catalog().num_edges() == 4);
        REQUIRE(sim.run().steps_completed == 60);

        fs::remove_all(dir);
    }

    SECTION("Missing graph fails initialization") {
        roadfleet::SimulationConfig config;
        config.graph_dir = "/non/existent/graph";
        roadfleet::Simulation sim(config,
                                  std::make_unique<roadfleet::adapters::GraphLoaderFile>(),
                                  std::make_unique<FakeChannelFactory>(make_line_catalog(2)));
        REQUIRE(!sim.initialize());
    }

    SECTION("Single node graph leaves the car waiting") {
        roadfleet::SimulationConfig config;
        config.catalog = roadfleet::core::EdgeCatalog(1, {});
        config.num_cars = 1;
        config.steps = 20;
        config.log_every = 0;

        roadfleet::Simulation sim(config, std::make_unique<FakeChannelFactory>(*config.catalog));
        REQUIRE(sim.initialize());
        auto summary = sim.run();

        REQUIRE(summary.waiting == 1);
        REQUIRE(summary.arrived == 0);
        REQUIRE(!summary.avg_steps_to_arrive.has_value());
        REQUIRE(summary.avg_wait_steps == 20.0);
    }

    SECTION("Metrics output generation") {
        fs::path metrics_file = fs::temp_directory_path() / "roadfleet_integration_metrics.json";
        fs::path trace_file = fs::temp_directory_path() / "roadfleet_integration_trace.csv";

        auto config = base_config(2, 30, 999);
        config.metrics_output = metrics_file;
        config.trace_output = trace_file;

        roadfleet::Simulation sim(config, std::make_unique<FakeChannelFactory>(*config.catalog));
        REQUIRE(sim.initialize());
        sim.run();

        REQUIRE(fs::exists(metrics_file));
        REQUIRE(fs::exists(trace_file));

        std::ifstream trace_in(trace_file);
        std::string header;
        std::getline(trace_in, header);
        REQUIRE(header == "step,driving,arrived,waiting,failed,active_jams");

        int rows = 0;
        std::string line;
        while (std::getline(trace_in, line)) {
            rows++;
        }
        REQUIRE(rows == 30);

        fs::remove(metrics_file);
        fs::remove(trace_file);
    }
}

TEST_CASE("Connection failures", "[integration]") {
    SECTION("Car that cannot connect aborts the run promptly") {
        auto config = base_config(4, 1'000'000, 7);
        auto factory = std::make_unique<FakeChannelFactory>(*config.catalog);
        factory->refuse_cars = {2};

        roadfleet::Simulation sim(config, std::move(factory));
        REQUIRE(sim.initialize());

        auto started = std::chrono::steady_clock::now();
        REQUIRE_THROWS_AS(sim.run(), roadfleet::core::SetupError);
        REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
    }

    SECTION("Connection lost mid-run stops only that car") {
        auto config = base_config(4, 200, 11);
        auto factory = std::make_unique<FakeChannelFactory>(*config.catalog);
        factory->drop_after_reports = {{1, 2}};

        roadfleet::Simulation sim(config, std::move(factory));
        REQUIRE(sim.initialize());
        auto summary = sim.run();

        REQUIRE(summary.steps_completed == 200);
        REQUIRE(summary.failed == 1);
        REQUIRE(sim.get_metrics().agent_failures == 1);

        const auto& failed_car = sim.get_agents()[1];
        REQUIRE(failed_car.failed());
        REQUIRE(!failed_car.failure_reason().empty());
        REQUIRE(failed_car.total_drive_steps() + failed_car.total_wait_steps() < 200);

        REQUIRE(sim.get_traces().back().failed == 1);
        for (const auto& agent : sim.get_agents()) {
            if (agent.car_id() != 1) {
                REQUIRE(agent.total_drive_steps() + agent.total_wait_steps() == 200);
            }
        }
    }

    SECTION("Run ends early when every car has failed") {
        auto config = base_config(2, 500, 3);
        config.agent_params.report_every = 1;
        auto factory = std::make_unique<FakeChannelFactory>(*config.catalog);
        factory->drop_after_reports = {{0, 1}, {1, 1}};

        roadfleet::Simulation sim(config, std::move(factory));
        REQUIRE(sim.initialize());
        auto summary = sim.run();

        REQUIRE(summary.failed == 2);
        REQUIRE(summary.steps_completed < 500);
    }
}

TEST_CASE("Runs are reproducible", "[integration][determinism]") {
    auto run_once = [](roadfleet::SimulationConfig config) {
        roadfleet::Simulation sim(config, std::make_unique<FakeChannelFactory>(*config.catalog));
        REQUIRE(sim.initialize());
        sim.run();
        return std::make_pair(outcomes(sim), sim.get_traces());
    };

    SECTION("Same seed, same trajectories") {
        auto config = base_config(8, 150, 2024);
        config.agent_params.reroute_every_steps = 7;

        auto [first, first_traces] = run_once(config);
        auto [second, second_traces] = run_once(config);

        REQUIRE(first == second);
        REQUIRE(first_traces.size() == second_traces.size());
        for (std::size_t i = 0; i < first_traces.size(); ++i) {
            REQUIRE(first_traces[i].driving == second_traces[i].driving);
            REQUIRE(first_traces[i].arrived == second_traces[i].arrived);
        }
    }

    SECTION("Same seed with frequent jams") {
        auto config = base_config(12, 150, 5);
        config.catalog = make_line_catalog(3, 40.0, 5.0);
        config.jam_params.probability = 0.5;
        config.jam_params.min_cars = 2;

        auto [first, first_traces] = run_once(config);
        auto [second, second_traces] = run_once(config);

        REQUIRE(first == second);
        for (std::size_t i = 0; i < first_traces.size(); ++i) {
            REQUIRE(first_traces[i].active_jams == second_traces[i].active_jams);
        }
    }

    SECTION("Different seeds diverge") {
        auto [first, first_traces] = run_once(base_config(8, 150, 1));
        auto [second, second_traces] = run_once(base_config(8, 150, 2));
        REQUIRE(!(first == second));
    }
}
