#include "roadfleet/adapters/line_protocol_channel.hpp"
#include <spdlog/fmt/fmt.h>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace roadfleet::adapters {

namespace line_codec {

namespace {

std::vector<std::string> tokenize(std::string_view line) {
    std::vector<std::string> tokens;
    std::istringstream iss{std::string(line)};
    std::string token;
    while (iss >> token) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

int parse_int(const std::string& token, std::string_view line) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        throw core::ProtocolError(fmt::format("bad integer '{}' in reply: {}", token, line));
    }
    return value;
}

double parse_double(const std::string& token, std::string_view line) {
    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (token.empty() || end != token.c_str() + token.size()) {
        throw core::ProtocolError(fmt::format("bad number '{}' in reply: {}", token, line));
    }
    return value;
}

int parse_count(const std::string& token, std::string_view line) {
    int count = parse_int(token, line);
    if (count < 0) {
        throw core::ProtocolError(fmt::format("negative count in reply: {}", line));
    }
    return count;
}

bool is_error(const std::vector<std::string>& tokens) {
    return !tokens.empty() && tokens[0] == "ERR";
}

} // namespace

std::string encode_route_request(core::NodeId src, core::NodeId dst) {
    return fmt::format("REQ {} {}", src, dst);
}

std::string encode_traffic_report(const ports::TrafficReport& report) {
    if (report.position_on_edge) {
        return fmt::format("UPD {} {:.3f} {:.3f}", report.edge_id, report.speed, *report.position_on_edge);
    }
    return fmt::format("UPD {} {:.3f}", report.edge_id, report.speed);
}

std::string encode_prediction_query(core::EdgeId edge) {
    return fmt::format("PRED {}", edge);
}

std::optional<core::Route> decode_route_reply(std::string_view line) {
    auto tokens = tokenize(line);
    if (is_error(tokens)) {
        return std::nullopt;
    }
    if (tokens.size() < 3) {
        throw core::ProtocolError(fmt::format("not a ROUTE reply: '{}'", line));
    }

    core::Route route;
    std::size_t edges_at = 0;
    int edge_count = 0;

    if (tokens[0] == "ROUTE2") {
        route.eta = parse_double(tokens[1], line);
        int node_count = parse_count(tokens[2], line);
        std::size_t count_at = 3 + static_cast<std::size_t>(node_count);
        if (count_at >= tokens.size()) {
            throw core::ProtocolError(fmt::format("ROUTE2 missing edge_count: '{}'", line));
        }
        for (std::size_t i = 3; i < count_at; ++i) {
            route.nodes.push_back(parse_int(tokens[i], line));
        }
        edge_count = parse_count(tokens[count_at], line);
        edges_at = count_at + 1;
    } else if (tokens[0] == "ROUTE") {
        route.eta = parse_double(tokens[1], line);
        edge_count = parse_count(tokens[2], line);
        edges_at = 3;
    } else {
        throw core::ProtocolError(fmt::format("not a ROUTE reply: '{}'", line));
    }

    std::size_t actual = tokens.size() - edges_at;
    if (actual != static_cast<std::size_t>(edge_count)) {
        throw core::ProtocolError(fmt::format("edge_count mismatch: declared {}, got {}", edge_count, actual));
    }
    for (std::size_t i = edges_at; i < tokens.size(); ++i) {
        route.edges.push_back(parse_int(tokens[i], line));
    }
    return route;
}

bool decode_ack(std::string_view line) {
    auto tokens = tokenize(line);
    if (tokens.size() == 1 && tokens[0] == "ACK") {
        return true;
    }
    if (is_error(tokens)) {
        return false;
    }
    throw core::ProtocolError(fmt::format("unexpected reply to UPD: '{}'", line));
}

std::optional<double> decode_prediction_reply(std::string_view line, core::EdgeId expected_edge) {
    auto tokens = tokenize(line);
    if (is_error(tokens)) {
        return std::nullopt;
    }
    if (tokens.size() != 3 || tokens[0] != "PRED") {
        throw core::ProtocolError(fmt::format("not a PRED reply: '{}'", line));
    }
    if (parse_int(tokens[1], line) != expected_edge) {
        throw core::ProtocolError(fmt::format("PRED reply for wrong edge, expected {}: '{}'", expected_edge, line));
    }
    return parse_double(tokens[2], line);
}

} // namespace line_codec

LineProtocolChannel::LineProtocolChannel(ports::LineStreamPtr stream)
    : stream_(std::move(stream)) {
}

std::optional<core::Route> LineProtocolChannel::request_route(const ports::RouteRequest& request) {
    stream_->write_line(line_codec::encode_route_request(request.start_node, request.destination_node));
    auto route = line_codec::decode_route_reply(stream_->read_line());
    if (route) {
        ports::require_consistent_route(request, *route);
    }
    return route;
}

bool LineProtocolChannel::report_traffic(const ports::TrafficReport& report) {
    stream_->write_line(line_codec::encode_traffic_report(report));
    return line_codec::decode_ack(stream_->read_line());
}

std::optional<double> LineProtocolChannel::predict_travel_time(core::EdgeId edge) {
    stream_->write_line(line_codec::encode_prediction_query(edge));
    return line_codec::decode_prediction_reply(stream_->read_line(), edge);
}

} // namespace roadfleet::adapters
