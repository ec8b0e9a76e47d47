#pragma once

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "runtime/config.hpp"

namespace relay {

namespace registry {
class ConnectionRegistry;
}
namespace dispatch {
class CommandDispatcher;
}

namespace channel {

class ChannelSession;

/**
 * @brief WebSocket listener for device connections
 *
 * Accepts TCP connections on channel.bind:channel.port and hands each one to
 * a ChannelSession. Runs its own io_context on channel.io_threads threads.
 */
class ChannelServer {
public:
    ChannelServer(const runtime::ChannelConfig &config, registry::ConnectionRegistry &registry,
                  dispatch::CommandDispatcher &dispatcher);
    ~ChannelServer();

    ChannelServer(const ChannelServer &) = delete;
    ChannelServer &operator=(const ChannelServer &) = delete;

    // Open the listener and start the I/O threads
    bool start(std::string &error);

    // Close the listener and every session, then join the I/O threads
    void stop();

    bool is_running() const { return running_.load(); }

    // Port actually bound (differs from config when port 0 was requested)
    int get_port() const { return port_; }

    size_t session_count() const;

private:
    void do_accept();
    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);
    void remove_session(const std::shared_ptr<ChannelSession> &session);

    const runtime::ChannelConfig config_;
    registry::ConnectionRegistry &registry_;
    dispatch::CommandDispatcher &dispatcher_;

    std::unique_ptr<boost::asio::io_context> ioc_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    int port_ = 0;

    mutable std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;
    std::unordered_set<std::shared_ptr<ChannelSession>> sessions_;
};

}  // namespace channel
}  // namespace relay
