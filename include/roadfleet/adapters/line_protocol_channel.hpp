#pragma once

#include "roadfleet/ports/iline_stream.hpp"
#include "roadfleet/ports/iroute_channel.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace roadfleet::adapters {

// Text encoding: REQ/ROUTE/ROUTE2, UPD/ACK, PRED, ERR.
namespace line_codec {

std::string encode_route_request(core::NodeId src, core::NodeId dst);
std::string encode_traffic_report(const ports::TrafficReport& report);
std::string encode_prediction_query(core::EdgeId edge);

// std::nullopt for "ERR ...". Throws core::ProtocolError for anything else
// that is not a well-formed ROUTE or ROUTE2 line.
std::optional<core::Route> decode_route_reply(std::string_view line);

// true for ACK, false for ERR, ProtocolError otherwise.
bool decode_ack(std::string_view line);

std::optional<double> decode_prediction_reply(std::string_view line, core::EdgeId expected_edge);

} // namespace line_codec

class LineProtocolChannel : public roadfleet::ports::IRouteChannel {
public:
    explicit LineProtocolChannel(ports::LineStreamPtr stream);
    ~LineProtocolChannel() override = default;

    std::optional<core::Route> request_route(const ports::RouteRequest& request) override;
    bool report_traffic(const ports::TrafficReport& report) override;
    std::optional<double> predict_travel_time(core::EdgeId edge) override;

private:
    ports::LineStreamPtr stream_;
};

} // namespace roadfleet::adapters
