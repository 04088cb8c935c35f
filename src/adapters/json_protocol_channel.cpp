#include "roadfleet/adapters/json_protocol_channel.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace roadfleet::adapters {

using nlohmann::json;

namespace json_codec {

namespace {

json parse_object(std::string_view line) {
    json reply;
    try {
        reply = json::parse(line.begin(), line.end());
    } catch (const json::parse_error& e) {
        throw core::ProtocolError(fmt::format("malformed JSON reply ({}): {}", e.what(), line));
    }
    if (!reply.is_object()) {
        throw core::ProtocolError(fmt::format("JSON reply is not an object: {}", line));
    }
    return reply;
}

} // namespace

std::string encode_route_request(const ports::RouteRequest& request) {
    json j = {
        {"user_id", request.user_id},
        {"car_id", request.car_id},
        {"start_node", request.start_node},
        {"destination_node", request.destination_node},
        {"timestamp", request.timestamp}
    };
    return j.dump();
}

std::string encode_traffic_report(const ports::TrafficReport& report) {
    json j = {
        {"user_id", report.user_id},
        {"car_id", report.car_id},
        {"timestamp", report.timestamp},
        {"edge_id", report.edge_id},
        {"position_on_edge", report.position_on_edge.value_or(0.0)},
        {"speed", report.speed}
    };
    return j.dump();
}

std::optional<core::Route> decode_route_reply(std::string_view line, const ports::RouteRequest& request) {
    json reply = parse_object(line);
    if (reply.contains("error")) {
        return std::nullopt;
    }

    core::Route route;
    try {
        if (reply.at("user_id").get<int>() != request.user_id ||
            reply.at("car_id").get<int>() != request.car_id) {
            throw core::ProtocolError(fmt::format(
                "reply ids do not match request (user {}, car {}): {}",
                request.user_id, request.car_id, line));
        }

        route.eta = reply.at("eta").get<double>();
        route.edges = reply.at("route_edges").get<std::vector<core::EdgeId>>();
        if (auto nodes = reply.find("route_nodes"); nodes != reply.end()) {
            route.nodes = nodes->get<std::vector<core::NodeId>>();
        }
        if (auto count = reply.find("edge_count"); count != reply.end() &&
            count->get<std::size_t>() != route.edges.size()) {
            throw core::ProtocolError(fmt::format(
                "edge_count mismatch: declared {}, got {}", count->get<std::size_t>(), route.edges.size()));
        }
    } catch (const json::exception& e) {
        throw core::ProtocolError(fmt::format("invalid route reply ({}): {}", e.what(), line));
    }
    return route;
}

bool decode_ack(std::string_view line) {
    json reply = parse_object(line);
    if (reply.contains("error")) {
        return false;
    }
    if (auto status = reply.find("status");
        status != reply.end() && status->is_string() && status->get<std::string>() == "ACK") {
        return true;
    }
    throw core::ProtocolError(fmt::format("unexpected reply to traffic report: {}", line));
}

} // namespace json_codec

JsonProtocolChannel::JsonProtocolChannel(ports::LineStreamPtr stream)
    : stream_(std::move(stream)) {
}

std::optional<core::Route> JsonProtocolChannel::request_route(const ports::RouteRequest& request) {
    stream_->write_line(json_codec::encode_route_request(request));
    auto route = json_codec::decode_route_reply(stream_->read_line(), request);
    if (route) {
        ports::require_consistent_route(request, *route);
    }
    return route;
}

bool JsonProtocolChannel::report_traffic(const ports::TrafficReport& report) {
    stream_->write_line(json_codec::encode_traffic_report(report));
    return json_codec::decode_ack(stream_->read_line());
}

} // namespace roadfleet::adapters
