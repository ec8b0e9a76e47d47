#pragma once

#include <cstdint>
#include <string>

namespace relay {
namespace connection {

// Interface for a live duplex channel to one device. Implemented by the
// WebSocket session; mocked in unit tests.
class IConnection {
public:
    virtual ~IConnection() = default;

    // Write one opaque text frame. Returns false (and sets error) when the
    // channel is closed or the write fails.
    virtual bool send_text(const std::string &payload, std::string &error) = 0;

    // Initiate close with a human readable reason. Idempotent.
    virtual void close(const std::string &reason) = 0;

    // Liveness flag (false once closed or after a transport error)
    virtual bool is_open() const = 0;

    virtual const std::string &device_id() const = 0;

    // Process-unique id for log correlation
    virtual uint64_t session_id() const = 0;
};

}  // namespace connection
}  // namespace relay
