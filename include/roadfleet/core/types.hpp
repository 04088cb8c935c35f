#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace roadfleet::core {

using NodeId = int;
using EdgeId = int;
using Step = int;

struct Edge {
    EdgeId id = 0;
    NodeId from_node = 0;
    NodeId to_node = 0;
    double length = 0.0;
    double speed_limit = 0.0;
};

struct Route {
    double eta = 0.0;
    std::vector<NodeId> nodes;  // empty unless the server sent ROUTE2
    std::vector<EdgeId> edges;

    bool empty() const noexcept { return edges.empty(); }
};

enum class CarState {
    WAITING_FOR_ROUTE,
    DRIVING,
    ARRIVED
};

constexpr std::string_view to_string(CarState state) noexcept {
    switch (state) {
        case CarState::WAITING_FOR_ROUTE: return "WAITING_FOR_ROUTE";
        case CarState::DRIVING: return "DRIVING";
        case CarState::ARRIVED: return "ARRIVED";
    }
    return "UNKNOWN";
}

// Could not establish an agent's connection. Fatal to the whole run.
class SetupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connection dropped, timed out or failed mid-run. Fatal to one agent.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reply was malformed or inconsistent with the request.
class ProtocolError : public TransportError {
public:
    using TransportError::TransportError;
};

} // namespace roadfleet::core
