#pragma once

#include <atomic>
#include <chrono>
#include <httplib.h>
#include <memory>
#include <string>
#include <thread>

#include "runtime/config.hpp"

// Forward declarations
namespace relay {
namespace registry {
class ConnectionRegistry;
}
namespace dispatch {
class CommandDispatcher;
}
}  // namespace relay

namespace relay {
namespace http {

/**
 * @brief HTTP front end for the relay
 *
 * Callers post commands here and read the set of live connections; the
 * CommandDispatcher and ConnectionRegistry do the actual work.
 *
 * listen_after_bind() runs on a dedicated thread and requests are served from
 * httplib's pool. POST /send holds its worker until the device replies or the
 * dispatch times out, so thread_pool_size caps concurrent in-flight commands.
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, const runtime::AuthConfig &auth,
               const runtime::DispatchConfig &dispatch_config, std::string service_name,
               registry::ConnectionRegistry &registry, dispatch::CommandDispatcher &dispatcher);

    ~HttpServer();

    // Binds config.bind:config.port and spawns the listener thread.
    // Returns false with error set when the port cannot be bound.
    bool start(std::string &error);

    // Idempotent; joins the listener thread
    void stop();

    bool is_running() const { return running_.load(); }

    int get_port() const { return port_; }

private:
    // Configuration
    runtime::HttpConfig config_;
    runtime::AuthConfig auth_;
    runtime::DispatchConfig dispatch_config_;
    std::string service_name_;
    int port_ = 0;

    // Core component references
    registry::ConnectionRegistry &registry_;
    dispatch::CommandDispatcher &dispatcher_;

    // Server state
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point started_at_;  // Set by start(), before the listener thread

    void install_cors();
    void install_error_handlers();
    void setup_routes();

    // Returns false (and fills res) when the x-api-key header is missing or wrong
    bool authorize(const httplib::Request &req, httplib::Response &res) const;

    // Route handlers (implemented in handlers/)
    void handle_post_send(const httplib::Request &req, httplib::Response &res);
    void handle_get_root(const httplib::Request &req, httplib::Response &res);
    void handle_get_health(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace relay
