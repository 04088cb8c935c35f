#include "roadfleet/core/car_agent.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace roadfleet::core {

CarAgent::CarAgent(int car_id,
                   int user_id,
                   uint64_t seed,
                   const EdgeCatalog& catalog,
                   JamModel& jams,
                   AgentParams params,
                   MetricsCollector* metrics)
    : car_id_(car_id)
    , user_id_(user_id)
    , catalog_(catalog)
    , jams_(jams)
    , params_(params)
    , metrics_(metrics)
    , rng_(seed) {
}

std::optional<EdgeId> CarAgent::current_edge() const {
    if (current_edge_index_ >= route_.size()) {
        return std::nullopt;
    }
    return route_[current_edge_index_];
}

void CarAgent::mark_failed(std::string reason) {
    failed_ = true;
    failure_reason_ = std::move(reason);
}

void CarAgent::step(Step step) {
    if (cooldown_remaining_ > 0) {
        cooldown_remaining_--;
    }

    if ((state_ == CarState::WAITING_FOR_ROUTE || state_ == CarState::ARRIVED) &&
        cooldown_remaining_ == 0) {
        request_new_route(step);
    }

    if (state_ == CarState::DRIVING) {
        drive(step);
    }

    if (speed_hold_remaining_ > 0) {
        speed_hold_remaining_--;
    }

    if (state_ == CarState::DRIVING) {
        total_drive_steps_++;
    } else {
        total_wait_steps_++;
    }
}

NodeId CarAgent::pick_destination(NodeId src) {
    int num_nodes = catalog_.num_nodes();
    if (num_nodes <= 1) {
        return src;
    }
    std::uniform_int_distribution<NodeId> node_dist(0, num_nodes - 1);
    NodeId dst = src;
    while (dst == src) {
        dst = node_dist(rng_);
    }
    return dst;
}

void CarAgent::request_new_route(Step step) {
    std::uniform_int_distribution<NodeId> node_dist(0, std::max(1, catalog_.num_nodes()) - 1);
    NodeId src = node_dist(rng_);
    NodeId dst = pick_destination(src);

    if (metrics_) metrics_->record_route_request();
    auto route = channel_->request_route({user_id_, car_id_, src, dst, step});

    if (!route) {
        state_ = CarState::WAITING_FOR_ROUTE;
        cooldown_remaining_ = params_.reroute_cooldown;
        if (metrics_) metrics_->record_route_rejection();
        spdlog::debug("Car {} got no route {}->{} at step {}", car_id_, src, dst, step);
        return;
    }

    adopt_route(*route, src, dst);
    cooldown_remaining_ = params_.route_cooldown;
    spdlog::debug("Step {}: car {} route {}->{} eta={:.3f} edges={}",
                  step, car_id_, src, dst, route->eta, route->edges.size());
}

void CarAgent::adopt_route(const Route& route, NodeId src, NodeId dst) {
    route_ = route.edges;
    current_edge_index_ = 0;
    position_on_edge_ = 0.0;
    state_ = route_.empty() ? CarState::WAITING_FOR_ROUTE : CarState::DRIVING;
    src_ = src;
    dst_ = dst;
}

void CarAgent::maybe_reroute(Step step, const Edge& edge) {
    if (params_.reroute_every_steps <= 0 || step == 0 ||
        step % params_.reroute_every_steps != 0 || !dst_) {
        return;
    }

    try {
        if (metrics_) metrics_->record_route_request();
        auto fresh = channel_->request_route({user_id_, car_id_, edge.to_node, *dst_, step});
        if (!fresh || fresh->empty()) {
            return;
        }
        route_.resize(current_edge_index_ + 1);
        route_.insert(route_.end(), fresh->edges.begin(), fresh->edges.end());
        if (metrics_) metrics_->record_reroute();
        spdlog::debug("Car {} rerouted from node {} with {} new edges",
                      car_id_, edge.to_node, fresh->edges.size());
    } catch (const TransportError& e) {
        spdlog::debug("Car {} keeps its route, reroute failed: {}", car_id_, e.what());
    }
}

void CarAgent::drive(Step step) {
    auto edge_id = current_edge();
    if (!edge_id) {
        state_ = CarState::ARRIVED;
        return;
    }

    const Edge* edge = catalog_.find(*edge_id);
    if (!edge) {
        spdlog::warn("Car {} routed over unknown edge {}", car_id_, *edge_id);
        state_ = CarState::WAITING_FOR_ROUTE;
        return;
    }

    maybe_reroute(step, *edge);

    jams_.maybe_start_jam(edge->id, car_id_, rng_);
    double jam_factor = jams_.jam_factor(edge->id);

    if (speed_hold_remaining_ <= 0) {
        std::uniform_real_distribution<double> factor_dist(params_.min_speed_factor,
                                                           params_.max_speed_factor);
        std::uniform_int_distribution<int> hold_dist(params_.speed_hold_min, params_.speed_hold_max);
        desired_speed_ = edge->speed_limit * factor_dist(rng_);
        speed_hold_remaining_ = hold_dist(rng_);
    }

    speed_ = std::min(std::max(0.1, desired_speed_ * jam_factor), edge->speed_limit);

    if (edge->length <= 0.0) {
        position_on_edge_ = 1.0;
    } else {
        position_on_edge_ += (speed_ * params_.dt) / edge->length;
    }

    if (params_.report_every > 0 && step % params_.report_every == 0) {
        ports::TrafficReport report{user_id_, car_id_, step, edge->id, speed_, std::nullopt};
        if (params_.report_position) {
            report.position_on_edge = position_on_edge_;
        }
        if (metrics_) metrics_->record_report_sent();
        if (!channel_->report_traffic(report) && metrics_) {
            metrics_->record_report_rejected();
        }
    }

    while (position_on_edge_ >= 1.0 && state_ == CarState::DRIVING) {
        position_on_edge_ -= 1.0;
        current_edge_index_++;
        if (current_edge_index_ >= route_.size()) {
            state_ = CarState::ARRIVED;
            cooldown_remaining_ = params_.arrival_cooldown;
            arrival_step_ = step;
            spdlog::info("Step {}: car {} arrived {}->{}", step, car_id_, *src_, *dst_);
            break;
        }
    }
}

} // namespace roadfleet::core
