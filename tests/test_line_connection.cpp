#include <catch2/catch_test_macros.hpp>
#include "roadfleet/adapters/line_connection.hpp"
#include "roadfleet/adapters/tcp_channel_factory.hpp"
#include "roadfleet/core/types.hpp"
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace roadfleet::adapters;
using namespace roadfleet::core;
using roadfleet::ports::Protocol;
using roadfleet::ports::RouteRequest;
using roadfleet::ports::TrafficReport;
using boost::asio::ip::tcp;
using namespace std::chrono_literals;

namespace {

// Accepts one client on a loopback port and hands the socket to a script.
class LoopbackServer {
public:
    using Script = std::function<void(tcp::socket&)>;

    explicit LoopbackServer(Script script)
        : acceptor_(io_context_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {
        port_ = acceptor_.local_endpoint().port();
        worker_ = std::thread([this, script = std::move(script)]() {
            boost::system::error_code error;
            tcp::socket socket(io_context_);
            acceptor_.accept(socket, error);
            if (!error) {
                script(socket);
            }
        });
    }

    ~LoopbackServer() {
        worker_.join();
    }

    uint16_t port() const { return port_; }

private:
    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::thread worker_;
};

std::string read_request(tcp::socket& socket, std::string& buffer) {
    boost::system::error_code error;
    auto n = boost::asio::read_until(socket, boost::asio::dynamic_buffer(buffer), '\n', error);
    if (error) {
        return {};
    }
    auto line = buffer.substr(0, n - 1);
    buffer.erase(0, n);
    return line;
}

void send_reply(tcp::socket& socket, const std::string& line) {
    boost::system::error_code error;
    boost::asio::write(socket, boost::asio::buffer(line + "\n"), error);
}

} // namespace

TEST_CASE("LineConnection framing", "[connection]") {
    SECTION("Lines are written and read with newline framing") {
        std::promise<std::string> received;
        LoopbackServer server([&received](tcp::socket& socket) {
            std::string buffer;
            received.set_value(read_request(socket, buffer));
            // Two replies in one segment, the second with CRLF
            send_reply(socket, "ROUTE 1.0 0\nACK\r");
        });

        auto conn = LineConnection::connect("127.0.0.1", server.port(), 2000ms);
        conn->write_line("REQ 0 1");
        REQUIRE(conn->read_line() == "ROUTE 1.0 0");
        REQUIRE(conn->read_line() == "ACK");
        REQUIRE(received.get_future().get() == "REQ 0 1");
    }

    SECTION("Server closing mid-read is a transport failure") {
        LoopbackServer server([](tcp::socket& socket) {
            std::string buffer;
            read_request(socket, buffer);
            socket.close();
        });

        auto conn = LineConnection::connect("127.0.0.1", server.port(), 2000ms);
        conn->write_line("REQ 0 1");
        REQUIRE_THROWS_AS(conn->read_line(), TransportError);
    }

    SECTION("Silent server times out") {
        std::promise<void> release;
        auto released = release.get_future();
        LoopbackServer server([&released](tcp::socket&) {
            released.wait();
        });

        auto conn = LineConnection::connect("127.0.0.1", server.port(), 100ms);
        conn->write_line("REQ 0 1");
        REQUIRE_THROWS_AS(conn->read_line(), TransportError);
        REQUIRE(!conn->is_open());
        REQUIRE_THROWS_AS(conn->write_line("REQ 0 1"), TransportError);
        release.set_value();
    }
}

TEST_CASE("LineConnection setup failures", "[connection]") {
    // Connections only come out of connect()
    STATIC_REQUIRE(!std::is_constructible_v<LineConnection, std::chrono::milliseconds>);

    SECTION("Nothing listening") {
        uint16_t port = 0;
        {
            boost::asio::io_context io_context;
            tcp::acceptor acceptor(io_context, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
            port = acceptor.local_endpoint().port();
        }
        REQUIRE_THROWS_AS(LineConnection::connect("127.0.0.1", port, 1000ms), SetupError);
    }

    SECTION("Unresolvable host") {
        REQUIRE_THROWS_AS(LineConnection::connect("host.invalid", 8080, 1000ms), SetupError);
    }
}

TEST_CASE("TcpChannelFactory", "[connection]") {
    SECTION("Protocol names") {
        REQUIRE(parse_protocol("line") == Protocol::LINE);
        REQUIRE(parse_protocol("json") == Protocol::JSON);
        REQUIRE(!parse_protocol("xml").has_value());
        REQUIRE(to_string(Protocol::JSON) == "json");
    }

    SECTION("Line channel over TCP") {
        LoopbackServer server([](tcp::socket& socket) {
            std::string buffer;
            if (read_request(socket, buffer) == "REQ 0 2") {
                send_reply(socket, "ROUTE2 3.000 3 0 1 2 2 0 2");
            }
            if (read_request(socket, buffer).rfind("UPD 0 ", 0) == 0) {
                send_reply(socket, "ACK");
            }
        });

        TcpChannelFactory factory(ServerEndpoint{"127.0.0.1", server.port(), 2000ms, Protocol::LINE});
        auto channel = factory.connect(0);

        auto route = channel->request_route(RouteRequest{0, 0, 0, 2, 0});
        REQUIRE(route.has_value());
        REQUIRE(route->edges == std::vector<EdgeId>{0, 2});
        REQUIRE(channel->report_traffic(TrafficReport{0, 0, 1, 0, 4.0, 0.5}));
    }

    SECTION("JSON channel over TCP") {
        LoopbackServer server([](tcp::socket& socket) {
            std::string buffer;
            auto request = nlohmann::json::parse(read_request(socket, buffer));
            nlohmann::json reply = {
                {"user_id", request.at("user_id")},
                {"car_id", request.at("car_id")},
                {"route_edges", {4, 5}},
                {"eta", 9.5}
            };
            send_reply(socket, reply.dump());
        });

        TcpChannelFactory factory(ServerEndpoint{"127.0.0.1", server.port(), 2000ms, Protocol::JSON});
        auto channel = factory.connect(3);

        auto route = channel->request_route(RouteRequest{3, 3, 0, 6, 12});
        REQUIRE(route.has_value());
        REQUIRE(route->edges == std::vector<EdgeId>{4, 5});
        REQUIRE(route->eta == 9.5);
    }

    SECTION("Refused connection is a setup failure") {
        uint16_t port = 0;
        {
            boost::asio::io_context io_context;
            tcp::acceptor acceptor(io_context, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
            port = acceptor.local_endpoint().port();
        }
        TcpChannelFactory factory(ServerEndpoint{"127.0.0.1", port, 1000ms, Protocol::LINE});
        REQUIRE_THROWS_AS(factory.connect(0), SetupError);
    }
}
