#pragma once

#include "roadfleet/ports/iline_stream.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace roadfleet::adapters {

// Blocking '\n'-framed TCP client. Every operation runs the private
// io_context for at most the configured timeout; on expiry the socket is
// closed and the operation fails with core::TransportError.
class LineConnection : public roadfleet::ports::ILineStream {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Throws core::SetupError.
    static std::unique_ptr<LineConnection> connect(const std::string& host,
                                                   uint16_t port,
                                                   std::chrono::milliseconds timeout);

    // Use connect().
    LineConnection(PrivateTag, std::chrono::milliseconds timeout);
    ~LineConnection() override;

    void write_line(std::string_view line) override;
    std::string read_line() override;

    bool is_open() const { return socket_.is_open(); }

private:
    void run_for_timeout();

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_{io_context_};
    std::string input_buffer_;
    std::chrono::milliseconds timeout_;
};

} // namespace roadfleet::adapters
