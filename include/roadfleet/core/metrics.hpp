#pragma once

#include "roadfleet/core/types.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <vector>

namespace roadfleet::core {

struct MetricsSnapshot {
    uint64_t route_requests = 0;
    uint64_t route_rejections = 0;
    uint64_t reroutes_applied = 0;
    uint64_t reports_sent = 0;
    uint64_t reports_rejected = 0;
    uint64_t jams_started = 0;
    uint64_t agent_failures = 0;
    Step steps_completed = 0;
    std::chrono::milliseconds wall_time{0};
};

struct StepTrace {
    Step step;
    int driving;
    int arrived;
    int waiting;
    int failed;
    int active_jams;
};

class MetricsCollector {
public:
    MetricsCollector() = default;

    void record_route_request() { route_requests_.fetch_add(1, std::memory_order_relaxed); }
    void record_route_rejection() { route_rejections_.fetch_add(1, std::memory_order_relaxed); }
    void record_reroute() { reroutes_applied_.fetch_add(1, std::memory_order_relaxed); }
    void record_report_sent() { reports_sent_.fetch_add(1, std::memory_order_relaxed); }
    void record_report_rejected() { reports_rejected_.fetch_add(1, std::memory_order_relaxed); }
    void record_jam_started() { jams_started_.fetch_add(1, std::memory_order_relaxed); }
    void record_agent_failure() { agent_failures_.fetch_add(1, std::memory_order_relaxed); }
    void set_steps_completed(Step steps) { steps_completed_ = steps; }

    void record_step_trace(const StepTrace& trace);

    MetricsSnapshot get_snapshot() const;
    std::vector<StepTrace> get_traces() const;

    void reset();

    void start_timer() { start_time_ = std::chrono::steady_clock::now(); }
    void stop_timer() {
        auto end_time = std::chrono::steady_clock::now();
        wall_time_ = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_);
    }

private:
    std::atomic<uint64_t> route_requests_{0};
    std::atomic<uint64_t> route_rejections_{0};
    std::atomic<uint64_t> reroutes_applied_{0};
    std::atomic<uint64_t> reports_sent_{0};
    std::atomic<uint64_t> reports_rejected_{0};
    std::atomic<uint64_t> jams_started_{0};
    std::atomic<uint64_t> agent_failures_{0};
    Step steps_completed_{0};

    mutable std::mutex trace_mutex_;
    std::vector<StepTrace> traces_;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::milliseconds wall_time_{0};
};

void emit_metrics_json(const std::filesystem::path& path, const MetricsSnapshot& metrics);
void emit_trace_csv(const std::filesystem::path& path, const std::vector<StepTrace>& traces);

} // namespace roadfleet::core
