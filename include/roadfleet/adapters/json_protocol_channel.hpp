#pragma once

#include "roadfleet/ports/iline_stream.hpp"
#include "roadfleet/ports/iroute_channel.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace roadfleet::adapters {

// One JSON object per line.
namespace json_codec {

std::string encode_route_request(const ports::RouteRequest& request);
std::string encode_traffic_report(const ports::TrafficReport& report);

// std::nullopt when the reply carries "error". Throws core::ProtocolError for
// malformed JSON, missing fields, or ids that do not echo the request.
std::optional<core::Route> decode_route_reply(std::string_view line, const ports::RouteRequest& request);

bool decode_ack(std::string_view line);

} // namespace json_codec

class JsonProtocolChannel : public roadfleet::ports::IRouteChannel {
public:
    explicit JsonProtocolChannel(ports::LineStreamPtr stream);
    ~JsonProtocolChannel() override = default;

    std::optional<core::Route> request_route(const ports::RouteRequest& request) override;
    bool report_traffic(const ports::TrafficReport& report) override;

    // Not part of the JSON contract.
    std::optional<double> predict_travel_time(core::EdgeId) override { return std::nullopt; }

private:
    ports::LineStreamPtr stream_;
};

} // namespace roadfleet::adapters
