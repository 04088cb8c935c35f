#include "roadfleet/core/jam_model.hpp"
#include "roadfleet/core/car_agent.hpp"
#include "roadfleet/core/metrics.hpp"
#include <spdlog/spdlog.h>

namespace roadfleet::core {

bool JamModel::maybe_start_jam(EdgeId edge, int car_id, std::mt19937_64& rng) {
    std::lock_guard lock(mutex_);

    if (active_.contains(edge)) {
        return false;
    }
    if (auto it = staged_.find(edge); it != staged_.end() && it->second.contains(car_id)) {
        return false;
    }

    auto occ_it = occupancy_.find(edge);
    int occupancy = occ_it != occupancy_.end() ? occ_it->second : 0;
    if (occupancy < params_.min_cars) {
        return false;
    }

    std::uniform_real_distribution<double> draw_dist(0.0, 1.0);
    if (draw_dist(rng) > params_.probability) {
        return false;
    }

    std::uniform_real_distribution<double> factor_dist(params_.min_factor, params_.max_factor);
    std::uniform_int_distribution<int> steps_dist(params_.min_steps, params_.max_steps);
    ActiveJam jam;
    jam.factor = factor_dist(rng);
    jam.remaining = steps_dist(rng);

    staged_[edge][car_id] = jam;
    return true;
}

double JamModel::jam_factor(EdgeId edge) const {
    std::lock_guard lock(mutex_);
    auto it = active_.find(edge);
    return it != active_.end() ? it->second.factor : 1.0;
}

void JamModel::publish_staged() {
    for (const auto& [edge, by_car] : staged_) {
        if (by_car.empty() || active_.contains(edge)) {
            continue;
        }
        const auto& [winner, jam] = *by_car.begin();
        active_.emplace(edge, jam);
        if (metrics_) metrics_->record_jam_started();
        spdlog::debug("Jam started on edge {} by car {}: factor {:.3f} for {} steps",
                      edge, winner, jam.factor, jam.remaining);
    }
    staged_.clear();
}

void JamModel::tick() {
    std::lock_guard lock(mutex_);

    for (auto it = active_.begin(); it != active_.end();) {
        if (--it->second.remaining <= 0) {
            it = active_.erase(it);
        } else {
            ++it;
        }
    }

    // Jams proposed during the finished step cover the next `remaining` steps.
    publish_staged();
}

void JamModel::update_occupancy(const std::vector<CarAgent>& agents) {
    OccupancyMap counts;
    for (const auto& agent : agents) {
        if (agent.failed() || agent.state() != CarState::DRIVING) {
            continue;
        }
        if (auto edge = agent.current_edge()) {
            counts[*edge]++;
        }
    }
    set_occupancy(std::move(counts));
}

void JamModel::set_occupancy(OccupancyMap occupancy) {
    std::lock_guard lock(mutex_);
    occupancy_ = std::move(occupancy);
}

int JamModel::occupancy(EdgeId edge) const {
    std::lock_guard lock(mutex_);
    auto it = occupancy_.find(edge);
    return it != occupancy_.end() ? it->second : 0;
}

OccupancyMap JamModel::occupancy_snapshot() const {
    std::lock_guard lock(mutex_);
    return occupancy_;
}

std::optional<ActiveJam> JamModel::active_jam(EdgeId edge) const {
    std::lock_guard lock(mutex_);
    if (auto it = active_.find(edge); it != active_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::size_t JamModel::active_jam_count() const {
    std::lock_guard lock(mutex_);
    return active_.size();
}

std::size_t JamModel::staged_jam_count() const {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& [edge, by_car] : staged_) {
        count += by_car.size();
    }
    return count;
}

} // namespace roadfleet::core
