#pragma once

#include "roadfleet/core/car_agent.hpp"
#include "roadfleet/core/edge_catalog.hpp"
#include "roadfleet/core/jam_model.hpp"
#include "roadfleet/core/metrics.hpp"
#include "roadfleet/core/step_barrier.hpp"
#include "roadfleet/ports/igraph_loader.hpp"
#include "roadfleet/ports/iroute_channel.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace roadfleet {

struct SimulationConfig {
    std::filesystem::path graph_dir;
    std::optional<core::EdgeCatalog> catalog;  // Used instead of graph_dir when set
    int num_cars = 10;
    int steps = 200;
    uint64_t seed = 1;
    int sleep_ms = 0;
    int log_every = 10;
    core::AgentParams agent_params;
    core::JamParams jam_params;
    std::filesystem::path trace_output;
    std::filesystem::path metrics_output;
};

struct RunSummary {
    int cars_total = 0;
    int arrived = 0;   // cars with a recorded arrival
    int driving = 0;
    int waiting = 0;   // not driving and never arrived
    int failed = 0;
    double avg_drive_steps = 0.0;
    double avg_wait_steps = 0.0;
    std::optional<double> avg_steps_to_arrive;
    core::Step steps_completed = 0;
};

// Per-car seeds are derived from the run seed so runs are reproducible.
constexpr uint64_t agent_seed(uint64_t run_seed, int car_id) {
    return run_seed + 1000 + static_cast<uint64_t>(car_id);
}

class Simulation {
public:
    // Invoked at the end of every boundary phase, while all agents are parked.
    using BoundaryObserver = std::function<void(core::Step finished_step,
                                                const std::vector<core::CarAgent>& agents,
                                                const core::JamModel& jams)>;

    Simulation(SimulationConfig config,
               ports::GraphLoaderPtr graph_loader,
               ports::ChannelFactoryPtr channels);

    Simulation(SimulationConfig config,
               ports::ChannelFactoryPtr channels);

    bool initialize();

    // Throws core::SetupError when any car cannot connect.
    RunSummary run();

    void set_boundary_observer(BoundaryObserver observer) { observer_ = std::move(observer); }

    core::MetricsSnapshot get_metrics() const { return metrics_collector_.get_snapshot(); }
    std::vector<core::StepTrace> get_traces() const { return metrics_collector_.get_traces(); }
    const std::vector<core::CarAgent>& get_agents() const { return agents_; }
    const core::JamModel& get_jam_model() const { return *jam_model_; }
    const core::EdgeCatalog& get_catalog() const { return *config_.catalog; }

private:
    SimulationConfig config_;
    ports::GraphLoaderPtr graph_loader_;
    ports::ChannelFactoryPtr channels_;

    std::unique_ptr<core::JamModel> jam_model_;
    std::vector<core::CarAgent> agents_;
    core::MetricsCollector metrics_collector_;
    BoundaryObserver observer_;

    core::Step steps_completed_ = 0;
    bool initialized_ = false;

    void run_agent(core::CarAgent& agent, core::StepBarrier& barrier);
    void boundary_phase();
    core::StepTrace trace_step(core::Step step) const;

    RunSummary summarize() const;
    void save_outputs();
};

} // namespace roadfleet
