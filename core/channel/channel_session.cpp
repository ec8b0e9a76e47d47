#include "channel_session.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>

#include "dispatch/command_dispatcher.hpp"
#include "logging/logger.hpp"
#include "registry/connection_registry.hpp"

namespace relay {
namespace channel {

namespace http = beast::http;

namespace {
constexpr auto kHandshakeTimeout = std::chrono::seconds(30);
constexpr size_t kMaxLoggedFrame = 200;

std::atomic<uint64_t> next_session_id{1};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool percent_decode(const std::string &in, std::string &out) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) {
            return false;
        }
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return true;
}

std::string preview(const std::string &frame) {
    return frame.size() <= kMaxLoggedFrame ? frame : frame.substr(0, kMaxLoggedFrame) + "...";
}

// String value of a JSON field; non-string values are serialized
std::string field_text(const nlohmann::json &message, const char *key) {
    auto it = message.find(key);
    if (it == message.end()) {
        return "";
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}
}  // namespace

bool parse_device_path(const std::string &target, const std::string &prefix, std::string &device_id) {
    const std::string path = target.substr(0, target.find('?'));
    if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }

    const std::string raw = path.substr(prefix.size());
    if (raw.find('/') != std::string::npos) {
        return false;
    }

    std::string decoded;
    if (!percent_decode(raw, decoded) || decoded.empty()) {
        return false;
    }
    device_id = decoded;
    return true;
}

ChannelSession::ChannelSession(tcp::socket &&socket, const runtime::ChannelConfig &config,
                               registry::ConnectionRegistry &registry, dispatch::CommandDispatcher &dispatcher,
                               FinishedCallback on_finished)
    : ws_(std::move(socket)),
      config_(config),
      registry_(registry),
      dispatcher_(dispatcher),
      on_finished_(std::move(on_finished)),
      session_id_(next_session_id.fetch_add(1, std::memory_order_relaxed)) {}

ChannelSession::~ChannelSession() { LOG_DEBUG("[Channel] Session " << session_id_ << " destroyed"); }

void ChannelSession::start() {
    // The socket was accepted on its own strand; run the first op there
    asio::dispatch(ws_.get_executor(), [self = shared_from_this()]() {
        beast::get_lowest_layer(self->ws_).expires_after(kHandshakeTimeout);
        http::async_read(self->ws_.next_layer(), self->buffer_, self->request_,
                         beast::bind_front_handler(&ChannelSession::on_request, self));
    });
}

void ChannelSession::on_request(beast::error_code ec, std::size_t) {
    if (ec) {
        LOG_DEBUG("[Channel] Session " << session_id_ << " upgrade read failed: " << ec.message());
        finish(ec);
        return;
    }

    if (!websocket::is_upgrade(request_)) {
        reject(http::status::upgrade_required, "WebSocket upgrade required\n");
        return;
    }

    const std::string target(request_.target());
    if (!parse_device_path(target, config_.path_prefix, device_id_)) {
        LOG_WARN("[Channel] Rejecting connection to unknown path: " << target);
        reject(http::status::not_found, "Expected " + config_.path_prefix + "{device_id}\n");
        return;
    }

    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type &res) { res.set(http::field::server, "relay-channel"); }));
    ws_.read_message_max(config_.max_message_bytes);

    ws_.async_accept(request_, beast::bind_front_handler(&ChannelSession::on_accept, shared_from_this()));
}

void ChannelSession::reject(http::status status, const std::string &body) {
    auto response = std::make_shared<http::response<http::string_body>>(status, request_.version());
    response->set(http::field::content_type, "text/plain");
    response->keep_alive(false);
    response->body() = body;
    response->prepare_payload();

    http::async_write(ws_.next_layer(), *response,
                      [self = shared_from_this(), response](beast::error_code ec, std::size_t) {
                          beast::error_code shutdown_ec;
                          beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send,
                                                                               shutdown_ec);
                          if (shutdown_ec) {
                              LOG_DEBUG("[Channel] Shutdown after reject: " << shutdown_ec.message());
                          }
                          self->finish(ec);
                      });
}

void ChannelSession::on_accept(beast::error_code ec) {
    if (ec) {
        LOG_WARN("[Channel] Handshake failed for " << device_id_ << ": " << ec.message());
        device_id_.clear();
        finish(ec);
        return;
    }

    accepted_ = true;
    open_.store(true, std::memory_order_release);

    beast::error_code endpoint_ec;
    auto remote = beast::get_lowest_layer(ws_).socket().remote_endpoint(endpoint_ec);
    LOG_INFO("[Channel] Device " << device_id_ << " connected (session " << session_id_ << ", "
                                 << (endpoint_ec ? std::string("unknown peer") : remote.address().to_string())
                                 << ")");

    registry_.register_connection(device_id_, shared_from_this());

    nlohmann::json welcome = {{"type", "connected"},
                              {"message", "Device " + device_id_ + " connected successfully"},
                              {"device_id", device_id_}};
    enqueue_write(PendingWrite{welcome.dump(), nullptr});

    do_read();
}

void ChannelSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&ChannelSession::on_read, shared_from_this()));
}

void ChannelSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec == websocket::error::closed) {
            LOG_INFO("[Channel] Device " << device_id_ << " disconnected (session " << session_id_ << ")");
        } else {
            LOG_INFO("[Channel] Device " << device_id_ << " connection lost (session " << session_id_
                                         << "): " << ec.message());
        }
        finish(ec);
        return;
    }

    std::string payload = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    handle_frame(payload);
    do_read();
}

void ChannelSession::handle_frame(const std::string &payload) {
    auto message = nlohmann::json::parse(payload, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        LOG_DEBUG("[Channel] Plain text from " << device_id_ << ": " << preview(payload));
    } else {
        std::string type = field_text(message, "type");
        if (type == "error") {
            LOG_ERROR("[Channel] Device " << device_id_ << " error: " << field_text(message, "error"));
        } else if (type == "status") {
            LOG_INFO("[Channel] Device " << device_id_ << " status: " << field_text(message, "status"));
        } else {
            LOG_DEBUG("[Channel] Device " << device_id_ << " response: " << preview(field_text(message, "data")));
        }
    }

    dispatcher_.deliver_frame(device_id_, shared_from_this(), payload);
}

bool ChannelSession::send_text(const std::string &payload, std::string &error) {
    if (!is_open()) {
        error = "Connection closed";
        return false;
    }

    auto done = std::make_shared<std::promise<beast::error_code>>();
    auto result = done->get_future();
    asio::post(ws_.get_executor(), [self = shared_from_this(), data = payload, done]() mutable {
        self->enqueue_write(PendingWrite{std::move(data), done});
    });

    if (result.wait_for(std::chrono::milliseconds(config_.send_timeout_ms)) != std::future_status::ready) {
        error = "Timed out writing frame";
        return false;
    }

    beast::error_code ec;
    try {
        ec = result.get();
    } catch (const std::future_error &e) {
        error = std::string("Write abandoned: ") + e.what();
        return false;
    }

    if (ec) {
        error = "Write failed: " + ec.message();
        return false;
    }
    return true;
}

void ChannelSession::close(const std::string &reason) {
    open_.store(false, std::memory_order_release);
    asio::post(ws_.get_executor(), [self = shared_from_this(), reason]() {
        if (self->close_requested_ || self->finished_) {
            return;
        }
        self->close_requested_ = true;
        self->close_reason_ = reason;
        if (!self->writing_) {
            self->start_close();
        }
    });
}

void ChannelSession::enqueue_write(PendingWrite write) {
    if (finished_ || close_requested_) {
        if (write.done) {
            write.done->set_value(beast::error_code(websocket::error::closed));
        }
        return;
    }

    write_queue_.push_back(std::move(write));
    if (!writing_) {
        do_write();
    }
}

void ChannelSession::do_write() {
    writing_ = true;
    ws_.text(true);
    ws_.async_write(asio::buffer(write_queue_.front().data),
                    beast::bind_front_handler(&ChannelSession::on_write, shared_from_this()));
}

void ChannelSession::on_write(beast::error_code ec, std::size_t) {
    writing_ = false;

    PendingWrite completed = std::move(write_queue_.front());
    write_queue_.pop_front();
    if (completed.done) {
        completed.done->set_value(ec);
    }

    if (finished_) {
        return;
    }

    if (ec) {
        LOG_WARN("[Channel] Write to " << device_id_ << " failed: " << ec.message());
        open_.store(false, std::memory_order_release);
        // Drops the TCP connection; the pending read then fails and calls finish()
        beast::get_lowest_layer(ws_).close();
        return;
    }

    if (!write_queue_.empty()) {
        do_write();
        return;
    }

    if (close_requested_ && !close_started_) {
        start_close();
    }
}

void ChannelSession::start_close() {
    close_started_ = true;

    if (!accepted_) {
        beast::get_lowest_layer(ws_).close();
        return;
    }

    LOG_INFO("[Channel] Closing session " << session_id_ << " for " << device_id_ << ": " << close_reason_);
    websocket::close_reason reason(websocket::close_code::normal, close_reason_);
    ws_.async_close(reason, [self = shared_from_this()](beast::error_code ec) {
        if (ec) {
            LOG_DEBUG("[Channel] Close handshake for session " << self->session_id_ << ": " << ec.message());
            beast::get_lowest_layer(self->ws_).close();
        }
        // The read loop observes the close and calls finish()
    });
}

void ChannelSession::finish(const beast::error_code &ec) {
    if (finished_) {
        return;
    }
    finished_ = true;
    open_.store(false, std::memory_order_release);

    // Fail queued writes; an in-flight write completes through on_write
    const beast::error_code failure = ec ? ec : beast::error_code(websocket::error::closed);
    const size_t first = writing_ ? 1 : 0;
    for (size_t i = first; i < write_queue_.size(); ++i) {
        if (write_queue_[i].done) {
            write_queue_[i].done->set_value(failure);
        }
    }
    write_queue_.erase(write_queue_.begin() + static_cast<std::ptrdiff_t>(first), write_queue_.end());

    auto self = shared_from_this();
    if (accepted_) {
        registry_.unregister_connection(device_id_, self);
    }
    if (on_finished_) {
        on_finished_(self);
    }
}

}  // namespace channel
}  // namespace relay
