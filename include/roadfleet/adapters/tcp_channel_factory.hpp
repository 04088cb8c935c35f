#pragma once

#include "roadfleet/ports/iroute_channel.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace roadfleet::adapters {

struct ServerEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    std::chrono::milliseconds timeout{3000};
    ports::Protocol protocol = ports::Protocol::LINE;
};

std::optional<ports::Protocol> parse_protocol(std::string_view name);
std::string_view to_string(ports::Protocol protocol);

// Opens one LineConnection per car and wraps it in the configured encoding.
class TcpChannelFactory : public roadfleet::ports::IChannelFactory {
public:
    explicit TcpChannelFactory(ServerEndpoint endpoint) : endpoint_(std::move(endpoint)) {}
    ~TcpChannelFactory() override = default;

    ports::ChannelPtr connect(int car_id) override;

    const ServerEndpoint& endpoint() const { return endpoint_; }

private:
    ServerEndpoint endpoint_;
};

} // namespace roadfleet::adapters
