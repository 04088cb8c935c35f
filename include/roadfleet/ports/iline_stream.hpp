#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace roadfleet::ports {

// A '\n'-framed bidirectional byte stream. Both calls throw
// core::TransportError when the peer is gone or the transport times out.
class ILineStream {
public:
    virtual ~ILineStream() = default;

    virtual void write_line(std::string_view line) = 0;

    // Returns one line without its trailing "\n" or "\r\n".
    virtual std::string read_line() = 0;
};

using LineStreamPtr = std::unique_ptr<ILineStream>;

} // namespace roadfleet::ports
