#include "roadfleet/simulation.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <future>
#include <thread>

namespace roadfleet {

Simulation::Simulation(SimulationConfig config,
                       ports::GraphLoaderPtr graph_loader,
                       ports::ChannelFactoryPtr channels)
    : config_(std::move(config))
    , graph_loader_(std::move(graph_loader))
    , channels_(std::move(channels)) {
}

Simulation::Simulation(SimulationConfig config,
                       ports::ChannelFactoryPtr channels)
    : config_(std::move(config))
    , channels_(std::move(channels)) {
}

bool Simulation::initialize() {
    spdlog::info("Initializing simulation with seed {}", config_.seed);

    if (!config_.catalog.has_value() && graph_loader_) {
        // Load from files if catalog not provided directly
        auto catalog = graph_loader_->load(config_.graph_dir);
        if (!catalog) {
            spdlog::error("Failed to load graph from {}", config_.graph_dir.string());
            return false;
        }
        config_.catalog = std::move(*catalog);
    }

    if (!config_.catalog.has_value() || config_.catalog->num_nodes() <= 0) {
        spdlog::error("No graph provided");
        return false;
    }
    if (config_.num_cars <= 0) {
        spdlog::error("Number of cars must be positive");
        return false;
    }
    if (!channels_) {
        spdlog::error("No route channel factory provided");
        return false;
    }

    jam_model_ = std::make_unique<core::JamModel>(config_.jam_params, &metrics_collector_);

    agents_.clear();
    agents_.reserve(static_cast<std::size_t>(config_.num_cars));
    for (int car_id = 0; car_id < config_.num_cars; ++car_id) {
        agents_.emplace_back(car_id, car_id, agent_seed(config_.seed, car_id),
                             *config_.catalog, *jam_model_, config_.agent_params,
                             &metrics_collector_);
    }

    spdlog::info("Initialized {} cars", agents_.size());
    steps_completed_ = 0;
    initialized_ = true;
    return true;
}

RunSummary Simulation::run() {
    if (!initialized_) {
        throw std::logic_error("Simulation::run called before initialize");
    }

    spdlog::info("Starting simulation: {} cars, {} steps", agents_.size(), config_.steps);
    metrics_collector_.reset();
    metrics_collector_.start_timer();

    core::StepBarrier barrier(agents_.size(), [this] { boundary_phase(); });

    // One long-lived worker per car; each future carries that worker's failure.
    std::vector<std::future<void>> workers;
    workers.reserve(agents_.size());
    for (auto& agent : agents_) {
        workers.push_back(std::async(std::launch::async, [this, &agent, &barrier]() {
            run_agent(agent, barrier);
        }));
    }

    std::exception_ptr first_error;
    for (auto& worker : workers) {
        try {
            worker.get();
        } catch (const std::exception&) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }

    metrics_collector_.stop_timer();
    metrics_collector_.set_steps_completed(steps_completed_);

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    if (steps_completed_ < config_.steps) {
        spdlog::warn("Run ended after {} of {} steps, every car failed", steps_completed_, config_.steps);
    }

    save_outputs();

    auto summary = summarize();
    spdlog::info("Simulation completed in {} steps", steps_completed_);
    return summary;
}

void Simulation::run_agent(core::CarAgent& agent, core::StepBarrier& barrier) {
    try {
        agent.attach_channel(channels_->connect(agent.car_id()));
    } catch (const core::SetupError& e) {
        spdlog::error("Connect failed for car {}: {}", agent.car_id(), e.what());
        barrier.abort();
        throw core::SetupError("connect failed for car " + std::to_string(agent.car_id()) + ": " + e.what());
    }

    if (barrier.aborted()) {
        return;
    }

    for (core::Step step = 0; step < config_.steps; ++step) {
        try {
            agent.step(step);
        } catch (const core::TransportError& e) {
            spdlog::warn("Car {} stopped at step {}: {}", agent.car_id(), step, e.what());
            agent.mark_failed(e.what());
            metrics_collector_.record_agent_failure();
            barrier.retire();
            return;
        } catch (const std::exception&) {
            barrier.abort();
            throw;
        }

        if (!barrier.arrive_and_wait()) {
            return;
        }
    }
}

core::StepTrace Simulation::trace_step(core::Step step) const {
    core::StepTrace trace{step, 0, 0, 0, 0, static_cast<int>(jam_model_->active_jam_count())};
    for (const auto& agent : agents_) {
        if (agent.failed()) {
            trace.failed++;
            continue;
        }
        switch (agent.state()) {
            case core::CarState::DRIVING: trace.driving++; break;
            case core::CarState::ARRIVED: trace.arrived++; break;
            case core::CarState::WAITING_FOR_ROUTE: trace.waiting++; break;
        }
    }
    return trace;
}

void Simulation::boundary_phase() {
    jam_model_->update_occupancy(agents_);
    jam_model_->tick();

    core::Step finished = steps_completed_++;
    auto trace = trace_step(finished);
    metrics_collector_.record_step_trace(trace);

    if (config_.log_every > 0 && steps_completed_ % config_.log_every == 0) {
        spdlog::info("Step {}: driving={} arrived={} waiting={} failed={} jams={}",
                     steps_completed_, trace.driving, trace.arrived, trace.waiting,
                     trace.failed, trace.active_jams);
    }

    if (observer_) {
        observer_(finished, agents_, *jam_model_);
    }

    if (config_.sleep_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.sleep_ms));
    }
}

RunSummary Simulation::summarize() const {
    RunSummary summary;
    summary.cars_total = static_cast<int>(agents_.size());
    summary.steps_completed = steps_completed_;

    long drive_total = 0;
    long wait_total = 0;
    long arrival_total = 0;
    for (const auto& agent : agents_) {
        if (agent.arrival_step()) {
            summary.arrived++;
            arrival_total += *agent.arrival_step();
        }
        if (agent.state() == core::CarState::DRIVING) {
            summary.driving++;
        } else if (!agent.arrival_step()) {
            summary.waiting++;
        }
        if (agent.failed()) {
            summary.failed++;
        }
        drive_total += agent.total_drive_steps();
        wait_total += agent.total_wait_steps();
    }

    if (!agents_.empty()) {
        summary.avg_drive_steps = static_cast<double>(drive_total) / agents_.size();
        summary.avg_wait_steps = static_cast<double>(wait_total) / agents_.size();
    }
    if (summary.arrived > 0) {
        summary.avg_steps_to_arrive = static_cast<double>(arrival_total) / summary.arrived;
    }
    return summary;
}

void Simulation::save_outputs() {
    if (!config_.metrics_output.empty()) {
        try {
            core::emit_metrics_json(config_.metrics_output, metrics_collector_.get_snapshot());
            spdlog::info("Saved metrics to {}", config_.metrics_output.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to save metrics: {}", e.what());
        }
    }

    if (!config_.trace_output.empty()) {
        try {
            core::emit_trace_csv(config_.trace_output, metrics_collector_.get_traces());
            spdlog::info("Saved trace to {}", config_.trace_output.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to save trace: {}", e.what());
        }
    }
}

} // namespace roadfleet
