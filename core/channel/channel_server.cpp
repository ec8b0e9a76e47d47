#include "channel_server.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <chrono>

#include "channel_session.hpp"
#include "logging/logger.hpp"
#include "registry/connection_registry.hpp"

namespace relay {
namespace channel {

namespace {
constexpr auto kStopGrace = std::chrono::seconds(2);
}

ChannelServer::ChannelServer(const runtime::ChannelConfig &config, registry::ConnectionRegistry &registry,
                             dispatch::CommandDispatcher &dispatcher)
    : config_(config), registry_(registry), dispatcher_(dispatcher) {}

ChannelServer::~ChannelServer() { stop(); }

bool ChannelServer::start(std::string &error) {
    if (running_) {
        error = "Channel server already running";
        return false;
    }

    ioc_ = std::make_unique<asio::io_context>(config_.io_threads);
    acceptor_ = std::make_unique<tcp::acceptor>(asio::make_strand(*ioc_));

    beast::error_code ec;
    auto address = asio::ip::make_address(config_.bind, ec);
    if (ec) {
        error = "Invalid channel bind address '" + config_.bind + "': " + ec.message();
        return false;
    }
    tcp::endpoint endpoint(address, static_cast<unsigned short>(config_.port));

    acceptor_->open(endpoint.protocol(), ec);
    if (ec) {
        error = "Failed to open channel listener: " + ec.message();
        return false;
    }
    acceptor_->set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        error = "Failed to set reuse_address: " + ec.message();
        return false;
    }
    acceptor_->bind(endpoint, ec);
    if (ec) {
        error = "Failed to bind channel listener to " + config_.bind + ":" + std::to_string(config_.port) + ": " +
                ec.message();
        return false;
    }
    acceptor_->listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        error = "Failed to listen on channel port: " + ec.message();
        return false;
    }
    port_ = acceptor_->local_endpoint(ec).port();
    if (ec) {
        error = "Failed to read bound channel port: " + ec.message();
        return false;
    }

    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        asio::make_work_guard(*ioc_));
    running_ = true;
    do_accept();

    for (int i = 0; i < config_.io_threads; ++i) {
        threads_.emplace_back([this, i]() {
            try {
                ioc_->run();
            } catch (const std::exception &e) {
                LOG_ERROR("[Channel] I/O thread " << i << " terminated: " << e.what());
            }
        });
    }

    LOG_INFO("[Channel] Listening on ws://" << config_.bind << ":" << port_ << config_.path_prefix << "{device_id}");
    return true;
}

void ChannelServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("[Channel] Stopping channel server");

    asio::post(acceptor_->get_executor(), [this]() {
        beast::error_code ec;
        acceptor_->close(ec);
        if (ec) {
            LOG_DEBUG("[Channel] Acceptor close: " << ec.message());
        }
    });

    std::vector<std::shared_ptr<ChannelSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.assign(sessions_.begin(), sessions_.end());
    }
    for (const auto &session : sessions) {
        // Only sessions past the handshake have a device id to release
        if (session->is_open()) {
            registry_.unregister_connection(session->device_id(), session);
        }
        session->close("server shutting down");
    }
    sessions.clear();

    {
        std::unique_lock<std::mutex> lock(sessions_mutex_);
        if (!sessions_cv_.wait_for(lock, kStopGrace, [this]() { return sessions_.empty(); })) {
            LOG_WARN("[Channel] " << sessions_.size() << " session(s) did not close in time");
        }
    }

    work_guard_.reset();
    ioc_->stop();
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.clear();
    }

    LOG_INFO("[Channel] Channel server stopped");
}

size_t ChannelServer::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void ChannelServer::do_accept() {
    acceptor_->async_accept(asio::make_strand(*ioc_),
                            beast::bind_front_handler(&ChannelServer::on_accept, this));
}

void ChannelServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == asio::error::operation_aborted || !running_) {
            return;
        }
        LOG_WARN("[Channel] Accept failed: " << ec.message());
    } else {
        auto session = std::make_shared<ChannelSession>(
            std::move(socket), config_, registry_, dispatcher_,
            [this](const std::shared_ptr<ChannelSession> &finished) { remove_session(finished); });
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions_.insert(session);
        }
        session->start();
    }

    if (running_) {
        do_accept();
    }
}

void ChannelServer::remove_session(const std::shared_ptr<ChannelSession> &session) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(session);
    }
    sessions_cv_.notify_all();
}

}  // namespace channel
}  // namespace relay
