#pragma once

#include <atomic>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "connection/i_connection.hpp"
#include "runtime/config.hpp"

namespace relay {

namespace registry {
class ConnectionRegistry;
}
namespace dispatch {
class CommandDispatcher;
}

namespace channel {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Extract the device id from a WebSocket upgrade target
 *
 * "/ws/pi1?token=x" with prefix "/ws/" yields "pi1". The id is
 * percent-decoded and must be non-empty with no further '/'.
 */
bool parse_device_path(const std::string &target, const std::string &prefix, std::string &device_id);

/**
 * @brief One device WebSocket connection
 *
 * Lifecycle: read the HTTP upgrade request, validate the /ws/{device_id}
 * path, accept the handshake, register with the ConnectionRegistry, send the
 * welcome frame, then read frames until the peer goes away. Every inbound
 * frame is handed to the CommandDispatcher. On read failure or close the
 * session unregisters itself (identity-checked, so a newer session for the
 * same device is left alone).
 *
 * All stream operations run on the session strand. send_text() may be called
 * from any thread: it queues the frame on the strand and waits for the write
 * to complete, bounded by the configured send timeout. It must not be called
 * from this session's own strand.
 */
class ChannelSession : public connection::IConnection, public std::enable_shared_from_this<ChannelSession> {
public:
    using FinishedCallback = std::function<void(const std::shared_ptr<ChannelSession> &)>;

    ChannelSession(tcp::socket &&socket, const runtime::ChannelConfig &config, registry::ConnectionRegistry &registry,
                   dispatch::CommandDispatcher &dispatcher, FinishedCallback on_finished);
    ~ChannelSession() override;

    // Begin reading the upgrade request
    void start();

    // IConnection
    bool send_text(const std::string &payload, std::string &error) override;
    void close(const std::string &reason) override;
    bool is_open() const override { return open_.load(std::memory_order_acquire); }
    const std::string &device_id() const override { return device_id_; }
    uint64_t session_id() const override { return session_id_; }

private:
    struct PendingWrite {
        std::string data;
        std::shared_ptr<std::promise<beast::error_code>> done;  // null for fire-and-forget
    };

    void on_request(beast::error_code ec, std::size_t bytes_transferred);
    void reject(beast::http::status status, const std::string &body);
    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void handle_frame(const std::string &payload);

    // Strand-only helpers
    void enqueue_write(PendingWrite write);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);
    void start_close();

    void finish(const beast::error_code &ec);

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    beast::http::request<beast::http::string_body> request_;

    const runtime::ChannelConfig config_;
    registry::ConnectionRegistry &registry_;
    dispatch::CommandDispatcher &dispatcher_;
    FinishedCallback on_finished_;

    const uint64_t session_id_;
    std::string device_id_;  // Set once during handshake, read-only afterwards
    std::atomic<bool> open_{false};

    // Strand-owned state
    std::deque<PendingWrite> write_queue_;
    bool accepted_ = false;
    bool writing_ = false;
    bool close_requested_ = false;
    bool close_started_ = false;
    bool finished_ = false;
    std::string close_reason_;
};

}  // namespace channel
}  // namespace relay
