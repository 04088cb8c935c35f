#include "roadfleet/adapters/tcp_channel_factory.hpp"
#include "roadfleet/adapters/json_protocol_channel.hpp"
#include "roadfleet/adapters/line_connection.hpp"
#include "roadfleet/adapters/line_protocol_channel.hpp"
#include <spdlog/spdlog.h>

namespace roadfleet::adapters {

std::optional<ports::Protocol> parse_protocol(std::string_view name) {
    if (name == "line") return ports::Protocol::LINE;
    if (name == "json") return ports::Protocol::JSON;
    return std::nullopt;
}

std::string_view to_string(ports::Protocol protocol) {
    return protocol == ports::Protocol::JSON ? "json" : "line";
}

ports::ChannelPtr TcpChannelFactory::connect(int car_id) {
    auto stream = LineConnection::connect(endpoint_.host, endpoint_.port, endpoint_.timeout);
    spdlog::debug("Car {} connected to {}:{} ({})",
                  car_id, endpoint_.host, endpoint_.port, to_string(endpoint_.protocol));

    switch (endpoint_.protocol) {
        case ports::Protocol::JSON:
            return std::make_unique<JsonProtocolChannel>(std::move(stream));
        case ports::Protocol::LINE:
            break;
    }
    return std::make_unique<LineProtocolChannel>(std::move(stream));
}

} // namespace roadfleet::adapters
