#pragma once

#include "roadfleet/core/types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <unordered_map>
#include <vector>

namespace roadfleet::core {

class CarAgent;

struct JamParams {
    double probability = 0.02;
    double min_factor = 0.2;
    double max_factor = 0.6;
    int min_steps = 5;
    int max_steps = 20;
    int min_cars = 3;
};

struct ActiveJam {
    double factor = 1.0;
    int remaining = 0;
};

using OccupancyMap = std::unordered_map<EdgeId, int>;

class MetricsCollector;

// Shared jam and occupancy state.
//
// Agents only read the state published at the last step boundary. During a
// step maybe_start_jam() merely stages a proposal under the car id; nobody
// drives with it. tick() starts at most one jam per edge, taken from the
// lowest car id that proposed one.
class JamModel {
public:
    explicit JamModel(JamParams params, MetricsCollector* metrics = nullptr)
        : params_(params), metrics_(metrics) {}

    // true when this car's proposal was staged for the next boundary.
    bool maybe_start_jam(EdgeId edge, int car_id, std::mt19937_64& rng);
    double jam_factor(EdgeId edge) const;

    // Boundary phase only.
    void tick();
    void update_occupancy(const std::vector<CarAgent>& agents);
    void set_occupancy(OccupancyMap occupancy);

    int occupancy(EdgeId edge) const;
    OccupancyMap occupancy_snapshot() const;
    std::optional<ActiveJam> active_jam(EdgeId edge) const;
    std::size_t active_jam_count() const;
    std::size_t staged_jam_count() const;

    const JamParams& params() const noexcept { return params_; }

private:
    JamParams params_;
    MetricsCollector* metrics_;

    mutable std::mutex mutex_;
    std::unordered_map<EdgeId, ActiveJam> active_;
    std::map<EdgeId, std::map<int, ActiveJam>> staged_;
    OccupancyMap occupancy_;

    void publish_staged();
};

} // namespace roadfleet::core
