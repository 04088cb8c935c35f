#include "roadfleet/core/metrics.hpp"
#include <fstream>
#include <iomanip>

namespace roadfleet::core {

void MetricsCollector::record_step_trace(const StepTrace& trace) {
    std::lock_guard lock(trace_mutex_);
    traces_.push_back(trace);
}

MetricsSnapshot MetricsCollector::get_snapshot() const {
    MetricsSnapshot snapshot;
    snapshot.route_requests = route_requests_.load(std::memory_order_relaxed);
    snapshot.route_rejections = route_rejections_.load(std::memory_order_relaxed);
    snapshot.reroutes_applied = reroutes_applied_.load(std::memory_order_relaxed);
    snapshot.reports_sent = reports_sent_.load(std::memory_order_relaxed);
    snapshot.reports_rejected = reports_rejected_.load(std::memory_order_relaxed);
    snapshot.jams_started = jams_started_.load(std::memory_order_relaxed);
    snapshot.agent_failures = agent_failures_.load(std::memory_order_relaxed);
    snapshot.steps_completed = steps_completed_;
    snapshot.wall_time = wall_time_;
    return snapshot;
}

std::vector<StepTrace> MetricsCollector::get_traces() const {
    std::lock_guard lock(trace_mutex_);
    return traces_;
}

void MetricsCollector::reset() {
    route_requests_.store(0, std::memory_order_relaxed);
    route_rejections_.store(0, std::memory_order_relaxed);
    reroutes_applied_.store(0, std::memory_order_relaxed);
    reports_sent_.store(0, std::memory_order_relaxed);
    reports_rejected_.store(0, std::memory_order_relaxed);
    jams_started_.store(0, std::memory_order_relaxed);
    agent_failures_.store(0, std::memory_order_relaxed);
    steps_completed_ = 0;
    wall_time_ = std::chrono::milliseconds{0};

    std::lock_guard lock(trace_mutex_);
    traces_.clear();
}

void emit_metrics_json(const std::filesystem::path& path, const MetricsSnapshot& metrics) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open metrics file: " + path.string());
    }

    file << "{\n";
    file << "  \"route_requests\": " << metrics.route_requests << ",\n";
    file << "  \"route_rejections\": " << metrics.route_rejections << ",\n";
    file << "  \"reroutes_applied\": " << metrics.reroutes_applied << ",\n";
    file << "  \"reports_sent\": " << metrics.reports_sent << ",\n";
    file << "  \"reports_rejected\": " << metrics.reports_rejected << ",\n";
    file << "  \"jams_started\": " << metrics.jams_started << ",\n";
    file << "  \"agent_failures\": " << metrics.agent_failures << ",\n";
    file << "  \"steps_completed\": " << metrics.steps_completed << ",\n";
    file << "  \"wall_time_ms\": " << metrics.wall_time.count() << ",\n";

    double rejection_rate = metrics.route_requests > 0 ?
        static_cast<double>(metrics.route_rejections) / metrics.route_requests : 0.0;
    file << "  \"route_rejection_rate\": " << std::fixed << std::setprecision(4) << rejection_rate << "\n";
    file << "}\n";
}

void emit_trace_csv(const std::filesystem::path& path, const std::vector<StepTrace>& traces) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open trace file: " + path.string());
    }

    file << "step,driving,arrived,waiting,failed,active_jams\n";

    for (const auto& trace : traces) {
        file << trace.step << ","
             << trace.driving << ","
             << trace.arrived << ","
             << trace.waiting << ","
             << trace.failed << ","
             << trace.active_jams << "\n";
    }
}

} // namespace roadfleet::core
