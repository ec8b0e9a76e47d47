#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "channel/channel_server.hpp"
#include "config.hpp"
#include "dispatch/command_dispatcher.hpp"
#include "http/server.hpp"
#include "registry/connection_registry.hpp"

namespace relay {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RelayConfig &config);
    ~Runtime();

    // Initialize all components (registry, dispatcher, channel, HTTP)
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Stop listeners and close every device connection
    void shutdown();

private:
    // Staged initialization helpers
    bool init_core_services(std::string &error);
    bool init_channel(std::string &error);
    bool init_http(std::string &error);

    void log_status() const;

    RelayConfig config_;

    std::unique_ptr<registry::ConnectionRegistry> registry_;
    std::unique_ptr<dispatch::CommandDispatcher> dispatcher_;  // Must be destroyed before registry_
    std::unique_ptr<channel::ChannelServer> channel_server_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace relay
