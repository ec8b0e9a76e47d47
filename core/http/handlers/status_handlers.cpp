#include <chrono>

#include "../../dispatch/command_dispatcher.hpp"
#include "../../registry/connection_registry.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace relay {
namespace http {

//=============================================================================
// GET /
//=============================================================================
void HttpServer::handle_get_root(const httplib::Request &, httplib::Response &res) {
    auto uptime =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_).count();

    auto devices = registry_.snapshot();
    auto stats = dispatcher_.stats();

    nlohmann::json stats_json = {{"dispatched", stats.dispatched},
                                 {"replied", stats.replied},
                                 {"timed_out", stats.timed_out},
                                 {"disconnected", stats.disconnected},
                                 {"rejected_busy", stats.rejected_busy},
                                 {"offline", stats.offline},
                                 {"unsolicited", stats.unsolicited},
                                 {"pending", dispatcher_.pending_count()}};

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"service", "online"},
                               {"name", service_name_},
                               {"uptime_seconds", uptime},
                               {"active_connections", devices.size()},
                               {"devices", devices},
                               {"stats", stats_json}};

    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /health
//=============================================================================
void HttpServer::handle_get_health(const httplib::Request &, httplib::Response &res) {
    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"health", "healthy"}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace relay
