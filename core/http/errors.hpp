#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace relay
{
    namespace http
    {

        // Outcome codes carried in every response's "status" object.
        // Device-facing meanings:
        //   UNAUTHENTICATED      x-api-key missing or wrong (401)
        //   NOT_FOUND            device not connected, or send to it failed (404)
        //   FAILED_PRECONDITION  device already has a command in flight (409)
        //   UNAVAILABLE          device dropped or was replaced before replying (503)
        //   DEADLINE_EXCEEDED    no reply within the timeout (504)
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            UNAUTHENTICATED,
            NOT_FOUND,
            FAILED_PRECONDITION,
            UNAVAILABLE,
            DEADLINE_EXCEEDED,
            INTERNAL
        };

        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::UNAUTHENTICATED:
                return 401;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::FAILED_PRECONDITION:
                return 409;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::DEADLINE_EXCEEDED:
                return 504;
            default:
                return 500;
            }
        }

        inline std::string status_code_to_string(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return "OK";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::UNAUTHENTICATED:
                return "UNAUTHENTICATED";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::FAILED_PRECONDITION:
                return "FAILED_PRECONDITION";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::DEADLINE_EXCEEDED:
                return "DEADLINE_EXCEEDED";
            default:
                return "INTERNAL";
            }
        }

        // {"code": ..., "message": ...}; message defaults to "ok" or the code name
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            return {
                {"status", make_status(code, message)}};
        }

        /**
         * @brief Error body for a command that reached the dispatcher
         *
         * Callers of POST /send key off "success" and "device_id" as well as the
         * status object, so failed dispatches carry both.
         */
        inline nlohmann::json make_device_error(StatusCode code, const std::string &message,
                                                const std::string &device_id)
        {
            nlohmann::json body = make_error_response(code, message);
            body["success"] = false;
            body["device_id"] = device_id;
            return body;
        }

    } // namespace http
} // namespace relay
