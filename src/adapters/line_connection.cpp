#include "roadfleet/adapters/line_connection.hpp"
#include "roadfleet/core/types.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace roadfleet::adapters {

namespace asio = boost::asio;
using asio::ip::tcp;

LineConnection::LineConnection(PrivateTag, std::chrono::milliseconds timeout)
    : timeout_(timeout) {
}

LineConnection::~LineConnection() {
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

std::unique_ptr<LineConnection> LineConnection::connect(const std::string& host,
                                                        uint16_t port,
                                                        std::chrono::milliseconds timeout) {
    auto conn = std::make_unique<LineConnection>(PrivateTag{}, timeout);

    tcp::resolver resolver(conn->io_context_);
    boost::system::error_code error;
    auto endpoints = resolver.resolve(host, std::to_string(port), error);
    if (error) {
        throw core::SetupError(fmt::format("cannot resolve {}:{}: {}", host, port, error.message()));
    }

    error = asio::error::would_block;
    asio::async_connect(conn->socket_, endpoints,
        [&error](const boost::system::error_code& result, const tcp::endpoint&) {
            error = result;
        });
    conn->run_for_timeout();

    if (error) {
        throw core::SetupError(fmt::format("cannot connect to {}:{}: {}", host, port,
            error == asio::error::operation_aborted ? std::string("timed out") : error.message()));
    }

    conn->socket_.set_option(tcp::no_delay(true), error);
    return conn;
}

void LineConnection::run_for_timeout() {
    io_context_.restart();
    io_context_.run_for(timeout_);

    // Timed out: closing the socket cancels the pending operation, whose
    // handler then sees operation_aborted.
    if (!io_context_.stopped()) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        io_context_.run();
    }
}

void LineConnection::write_line(std::string_view line) {
    if (!socket_.is_open()) {
        throw core::TransportError("connection is closed");
    }

    std::string frame(line);
    frame.push_back('\n');

    boost::system::error_code error = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(frame),
        [&error](const boost::system::error_code& result, std::size_t) {
            error = result;
        });
    run_for_timeout();

    if (error) {
        throw core::TransportError(fmt::format("send failed: {}",
            error == asio::error::operation_aborted ? std::string("timed out") : error.message()));
    }
}

std::string LineConnection::read_line() {
    if (!socket_.is_open()) {
        throw core::TransportError("connection is closed");
    }

    boost::system::error_code error = asio::error::would_block;
    std::size_t length = 0;
    asio::async_read_until(socket_, asio::dynamic_buffer(input_buffer_), '\n',
        [&error, &length](const boost::system::error_code& result, std::size_t n) {
            error = result;
            length = n;
        });
    run_for_timeout();

    if (error == asio::error::eof) {
        throw core::TransportError("server closed connection");
    }
    if (error) {
        throw core::TransportError(fmt::format("receive failed: {}",
            error == asio::error::operation_aborted ? std::string("timed out") : error.message()));
    }

    std::string line = input_buffer_.substr(0, length - 1);
    input_buffer_.erase(0, length);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

} // namespace roadfleet::adapters
