#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../../dispatch/command_dispatcher.hpp"
#include "../errors.hpp"

namespace relay {
namespace http {

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(), "application/json");
}

// Helper: Map a dispatch outcome to the response status code
inline StatusCode dispatch_status_to_code(dispatch::DispatchStatus status) {
    switch (status) {
        case dispatch::DispatchStatus::OK:
            return StatusCode::OK;
        case dispatch::DispatchStatus::DEVICE_OFFLINE:
            return StatusCode::NOT_FOUND;
        case dispatch::DispatchStatus::DEVICE_BUSY:
            return StatusCode::FAILED_PRECONDITION;
        case dispatch::DispatchStatus::TIMEOUT:
            return StatusCode::DEADLINE_EXCEEDED;
        case dispatch::DispatchStatus::DEVICE_DISCONNECTED:
            return StatusCode::UNAVAILABLE;
        default:
            return StatusCode::INTERNAL;
    }
}

}  // namespace http
}  // namespace relay
