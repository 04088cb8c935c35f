#pragma once

#include "roadfleet/core/types.hpp"
#include <concepts>
#include <memory>
#include <optional>
#include <string>

namespace roadfleet::ports {

struct RouteRequest {
    int user_id = 0;
    int car_id = 0;
    core::NodeId start_node = 0;
    core::NodeId destination_node = 0;
    core::Step timestamp = 0;
};

struct TrafficReport {
    int user_id = 0;
    int car_id = 0;
    core::Step timestamp = 0;
    core::EdgeId edge_id = 0;
    double speed = 0.0;
    std::optional<double> position_on_edge;
};

enum class Protocol {
    LINE,
    JSON
};

// Route/report conversation with the routing server over one connection.
//
// Explicit rejections by the server are ordinary results (std::nullopt or
// false). Transport and parse failures throw core::TransportError.
class IRouteChannel {
public:
    virtual ~IRouteChannel() = default;

    virtual std::optional<core::Route> request_route(const RouteRequest& request) = 0;
    virtual bool report_traffic(const TrafficReport& report) = 0;

    // std::nullopt when the encoding has no prediction query or the server
    // refused it.
    virtual std::optional<double> predict_travel_time(core::EdgeId edge) = 0;
};

// A zero-edge route only makes sense when the endpoints coincide.
inline void require_consistent_route(const RouteRequest& request, const core::Route& route) {
    if (route.empty() && request.start_node != request.destination_node) {
        throw core::ProtocolError("empty route between distinct nodes " +
                                  std::to_string(request.start_node) + " and " +
                                  std::to_string(request.destination_node));
    }
}

template<typename T>
concept RouteChannelImpl = std::derived_from<T, IRouteChannel>;

using ChannelPtr = std::unique_ptr<IRouteChannel>;

class IChannelFactory {
public:
    virtual ~IChannelFactory() = default;

    // Throws core::SetupError when the connection cannot be established.
    virtual ChannelPtr connect(int car_id) = 0;
};

using ChannelFactoryPtr = std::unique_ptr<IChannelFactory>;

} // namespace roadfleet::ports
