#pragma once

#include "roadfleet/core/edge_catalog.hpp"
#include "roadfleet/core/jam_model.hpp"
#include "roadfleet/core/metrics.hpp"
#include "roadfleet/ports/iroute_channel.hpp"
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace roadfleet::core {

struct AgentParams {
    double dt = 1.0;
    double min_speed_factor = 0.4;
    double max_speed_factor = 1.0;
    int speed_hold_min = 3;
    int speed_hold_max = 10;
    int route_cooldown = 0;
    int reroute_cooldown = 3;
    int arrival_cooldown = 5;
    int reroute_every_steps = 0;  // 0 disables mid-route rerouting
    int report_every = 5;         // 0 disables traffic reports
    bool report_position = true;
};

class CarAgent {
public:
    CarAgent(int car_id,
             int user_id,
             uint64_t seed,
             const EdgeCatalog& catalog,
             JamModel& jams,
             AgentParams params,
             MetricsCollector* metrics = nullptr);

    void attach_channel(ports::ChannelPtr channel) { channel_ = std::move(channel); }
    bool has_channel() const noexcept { return channel_ != nullptr; }

    // Runs one simulated step. Throws TransportError when the connection fails;
    // the caller retires the agent.
    void step(Step step);

    void mark_failed(std::string reason);

    int car_id() const noexcept { return car_id_; }
    int user_id() const noexcept { return user_id_; }
    CarState state() const noexcept { return state_; }
    bool failed() const noexcept { return failed_; }
    const std::string& failure_reason() const noexcept { return failure_reason_; }

    const std::vector<EdgeId>& route() const noexcept { return route_; }
    std::size_t current_edge_index() const noexcept { return current_edge_index_; }
    std::optional<EdgeId> current_edge() const;
    double position_on_edge() const noexcept { return position_on_edge_; }
    double speed() const noexcept { return speed_; }
    double desired_speed() const noexcept { return desired_speed_; }
    int speed_hold_remaining() const noexcept { return speed_hold_remaining_; }
    int cooldown_remaining() const noexcept { return cooldown_remaining_; }
    int total_drive_steps() const noexcept { return total_drive_steps_; }
    int total_wait_steps() const noexcept { return total_wait_steps_; }
    std::optional<Step> arrival_step() const noexcept { return arrival_step_; }
    std::optional<NodeId> src() const noexcept { return src_; }
    std::optional<NodeId> dst() const noexcept { return dst_; }

private:
    int car_id_;
    int user_id_;
    const EdgeCatalog& catalog_;
    JamModel& jams_;
    AgentParams params_;
    MetricsCollector* metrics_;
    std::mt19937_64 rng_;
    ports::ChannelPtr channel_;

    CarState state_ = CarState::WAITING_FOR_ROUTE;
    std::vector<EdgeId> route_;
    std::size_t current_edge_index_ = 0;
    double position_on_edge_ = 0.0;
    double speed_ = 0.0;
    double desired_speed_ = 0.0;
    int speed_hold_remaining_ = 0;
    int cooldown_remaining_ = 0;
    int total_drive_steps_ = 0;
    int total_wait_steps_ = 0;
    std::optional<Step> arrival_step_;
    std::optional<NodeId> src_;
    std::optional<NodeId> dst_;

    bool failed_ = false;
    std::string failure_reason_;

    void request_new_route(Step step);
    void drive(Step step);
    void maybe_reroute(Step step, const Edge& edge);
    NodeId pick_destination(NodeId src);
    void adopt_route(const Route& route, NodeId src, NodeId dst);
};

} // namespace roadfleet::core
