#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace relay {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternal = 500;

constexpr const char *kAllowedMethods = "GET, POST, OPTIONS";
constexpr const char *kAllowedHeaders = "Content-Type, x-api-key";

// Allowlist entry is an exact origin, "*", or a pattern with one '*' (e.g. "http://localhost:*")
bool origin_matches(const std::string &pattern, const std::string &origin) {
    const auto star = pattern.find('*');
    if (star == std::string::npos) {
        return pattern == origin;
    }
    const std::string head = pattern.substr(0, star);
    const std::string tail = pattern.substr(star + 1);
    return origin.size() >= head.size() + tail.size() && origin.compare(0, head.size(), head) == 0 &&
           origin.compare(origin.size() - tail.size(), tail.size(), tail) == 0;
}
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, const runtime::AuthConfig &auth,
                       const runtime::DispatchConfig &dispatch_config, std::string service_name,
                       registry::ConnectionRegistry &registry, dispatch::CommandDispatcher &dispatcher)
    : config_(config),
      auth_(auth),
      dispatch_config_(dispatch_config),
      service_name_(std::move(service_name)),
      registry_(registry),
      dispatcher_(dispatcher) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    // Reads and writes are short; the long wait is inside the dispatcher
    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    // Each in-flight POST /send holds one worker for up to its reply timeout
    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    install_cors();
    setup_routes();
    install_error_handlers();

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    started_at_ = std::chrono::steady_clock::now();
    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::install_cors() {
    server_->set_post_routing_handler([origins = config_.cors_allowed_origins,
                                       credentials = config_.cors_allow_credentials](const httplib::Request &req,
                                                                                     httplib::Response &res) {
        if (!req.has_header("Origin")) {
            return;
        }
        const std::string origin = req.get_header_value("Origin");
        auto allowed = std::find_if(origins.begin(), origins.end(),
                                    [&origin](const std::string &pattern) { return origin_matches(pattern, origin); });
        if (allowed == origins.end()) {
            return;
        }

        // Browsers reject "*" on credentialed requests
        const bool echo_origin = *allowed != "*" || credentials;
        res.set_header("Access-Control-Allow-Origin", echo_origin ? origin : std::string("*"));
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowedHeaders);
        if (credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });
}

void HttpServer::install_error_handlers() {
    // Errors httplib raises itself (no route, unparseable request) get the same JSON shape as handler errors
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";
        switch (res.status) {
            case kStatusNotFound:
                code = StatusCode::NOT_FOUND;
                message = "Route not found: " + req.method + " " + req.path;
                break;
            case kStatusMethodNotAllowed:
                code = StatusCode::INVALID_ARGUMENT;
                message = "Method not allowed: " + req.method + " " + req.path;
                break;
            case kStatusBadRequest:
                code = StatusCode::INVALID_ARGUMENT;
                message = "Bad request";
                break;
            default:
                break;
        }
        res.set_content(make_error_response(code, message).dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown exception";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
        } catch (...) {
            // Non-standard exception type; reported below with the generic message
        }
        LOG_ERROR("[HTTP] " << req.method << " " << req.path << " threw: " << msg);

        res.status = kStatusInternal;
        res.set_content(make_error_response(StatusCode::INTERNAL, msg).dump(), "application/json");
    });
}

void HttpServer::setup_routes() {
    // POST /send - Relay a command to a device and return its reply
    server_->Post("/send",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_send(req, res); });

    // GET / - Service status and connected devices
    server_->Get("/", [this](const httplib::Request &req, httplib::Response &res) { handle_get_root(req, res); });

    // GET /health - Liveness check
    server_->Get("/health",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_health(req, res); });

    // OPTIONS catch-all for CORS preflight
    server_->Options(R"(/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowedHeaders);
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   POST /send");
    LOG_INFO("[HTTP]   GET  /");
    LOG_INFO("[HTTP]   GET  /health");
}

}  // namespace http
}  // namespace relay
