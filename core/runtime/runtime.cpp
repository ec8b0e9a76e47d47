#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace relay {
namespace runtime {

namespace {
constexpr auto kLoopInterval = std::chrono::milliseconds(100);
constexpr auto kStatusInterval = std::chrono::seconds(60);
}  // namespace

Runtime::Runtime(const RelayConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing " << config_.server.name);

    if (!init_core_services(error)) {
        return false;
    }

    if (!init_channel(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_core_services(std::string &) {
    registry_ = std::make_unique<registry::ConnectionRegistry>();

    dispatcher_ = std::make_unique<dispatch::CommandDispatcher>(
        *registry_, std::chrono::milliseconds(config_.dispatch.reply_timeout_ms));
    LOG_INFO("[Runtime] Dispatcher created (reply timeout " << config_.dispatch.reply_timeout_ms << "ms)");

    return true;
}

bool Runtime::init_channel(std::string &error) {
    channel_server_ = std::make_unique<channel::ChannelServer>(config_.channel, *registry_, *dispatcher_);

    if (!channel_server_->start(error)) {
        error = "Channel server failed to start: " + error;
        return false;
    }
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (!config_.http.enabled) {
        LOG_INFO("[Runtime] HTTP server disabled in config");
        return true;
    }

    http_server_ = std::make_unique<http::HttpServer>(config_.http, config_.auth, config_.dispatch,
                                                      config_.server.name, *registry_, *dispatcher_);

    if (!http_server_->start(error)) {
        error = "HTTP server failed to start: " + error;
        return false;
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    auto next_status = std::chrono::steady_clock::now() + kStatusInterval;
    while (running_) {
        std::this_thread::sleep_for(kLoopInterval);

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_status) {
            log_status();
            next_status = now + kStatusInterval;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    // Devices first: closing their sessions wakes every dispatch still waiting
    if (channel_server_) {
        LOG_INFO("[Runtime] Stopping channel server");
        channel_server_->stop();
    }

    // Sessions that did not finish in time are still registered
    if (registry_ && registry_->connection_count() > 0) {
        LOG_INFO("[Runtime] Closing " << registry_->connection_count() << " remaining device connection(s)");
        registry_->clear();
    }

    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }
}

void Runtime::log_status() const {
    auto stats = dispatcher_->stats();
    LOG_INFO("[Runtime] Status: " << registry_->connection_count() << " device(s) connected, "
                                  << dispatcher_->pending_count() << " pending, " << stats.dispatched
                                  << " dispatched, " << stats.replied << " replied, " << stats.timed_out
                                  << " timed out");
}

}  // namespace runtime
}  // namespace relay
