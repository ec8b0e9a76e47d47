#include <chrono>

#include "../../dispatch/command_dispatcher.hpp"
#include "../../logging/logger.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace relay {
namespace http {

namespace {
// Seconds since the epoch with sub-second precision, stamped on every command frame
double now_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}
}  // namespace

bool HttpServer::authorize(const httplib::Request &req, httplib::Response &res) const {
    if (!req.has_header("x-api-key")) {
        send_json(res, StatusCode::UNAUTHENTICATED,
                  make_error_response(StatusCode::UNAUTHENTICATED, "Missing x-api-key header"));
        return false;
    }

    if (req.get_header_value("x-api-key") != auth_.api_key) {
        LOG_WARN("[HTTP] Rejected request from " << req.remote_addr << ": invalid API key");
        send_json(res, StatusCode::UNAUTHENTICATED, make_error_response(StatusCode::UNAUTHENTICATED, "Invalid API key"));
        return false;
    }
    return true;
}

//=============================================================================
// POST /send
//=============================================================================
void HttpServer::handle_post_send(const httplib::Request &req, httplib::Response &res) {
    if (!authorize(req, res)) {
        return;
    }

    try {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.body);
        } catch (const std::exception &e) {
            send_json(res, StatusCode::INVALID_ARGUMENT,
                      make_error_response(StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what()));
            return;
        }

        if (!body.is_object()) {
            send_json(res, StatusCode::INVALID_ARGUMENT,
                      make_error_response(StatusCode::INVALID_ARGUMENT, "Request body must be a JSON object"));
            return;
        }

        if (!body.contains("device_id") || !body["device_id"].is_string() ||
            body["device_id"].get<std::string>().empty()) {
            send_json(res, StatusCode::INVALID_ARGUMENT,
                      make_error_response(StatusCode::INVALID_ARGUMENT, "Missing or invalid 'device_id' field"));
            return;
        }

        if (!body.contains("cmd") || !body["cmd"].is_string() || body["cmd"].get<std::string>().empty()) {
            send_json(res, StatusCode::INVALID_ARGUMENT,
                      make_error_response(StatusCode::INVALID_ARGUMENT, "Missing or invalid 'cmd' field"));
            return;
        }

        const std::string device_id = body["device_id"].get<std::string>();
        const std::string cmd = body["cmd"].get<std::string>();

        std::chrono::milliseconds timeout(dispatch_config_.reply_timeout_ms);
        if (body.contains("timeout_ms")) {
            const auto &value = body["timeout_ms"];
            if (!value.is_number_integer() || value.get<int64_t>() <= 0 ||
                value.get<int64_t>() > dispatch_config_.max_timeout_ms) {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT,
                                              "'timeout_ms' must be an integer in 1.." +
                                                  std::to_string(dispatch_config_.max_timeout_ms)));
                return;
            }
            timeout = std::chrono::milliseconds(value.get<int64_t>());
        }

        LOG_INFO("[HTTP] Command for device " << device_id << ": " << cmd);

        nlohmann::json frame = {{"cmd", cmd}, {"timestamp", now_seconds()}};
        auto result = dispatcher_.dispatch(device_id, frame.dump(), timeout);

        if (!result.success) {
            StatusCode status = dispatch_status_to_code(result.status);
            send_json(res, status, make_device_error(status, result.error_message, device_id));
            return;
        }

        nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                                   {"success", true},
                                   {"message", "Command '" + cmd + "' delivered to device " + device_id},
                                   {"device_id", device_id},
                                   {"reply", result.payload}};

        send_json(res, StatusCode::OK, response);
    } catch (const std::exception &e) {
        LOG_ERROR("[HTTP] Exception in handle_post_send: " << e.what());
        send_json(res, StatusCode::INTERNAL,
                  make_error_response(StatusCode::INTERNAL, std::string("Exception: ") + e.what()));
    }
}

}  // namespace http
}  // namespace relay
