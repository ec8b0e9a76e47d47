#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace relay {
namespace runtime {

// Placeholder key shipped in sample configs; using it logs a warning
constexpr const char *kPlaceholderApiKey = "your-secret-api-key-change-in-production";

struct ServerConfig {
    std::string name = "relay";  // Instance identifier (appears in logs and GET /)
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "0.0.0.0";                        // Bind address
    int port = 8000;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 16;                           // Worker threads (bounds concurrent dispatches)
};

struct AuthConfig {
    std::string api_key = kPlaceholderApiKey;  // Expected x-api-key header value
    std::string api_key_env = "API_KEY";       // Environment variable that overrides api_key
};

struct ChannelConfig {
    std::string bind = "0.0.0.0";              // WebSocket bind address
    int port = 8001;                           // WebSocket port
    std::string path_prefix = "/ws/";          // Devices connect to <path_prefix><device_id>
    int io_threads = 2;                        // Threads running the I/O context
    size_t max_message_bytes = 1024u * 1024u;  // Larger inbound frames close the session
    int send_timeout_ms = 2000;                // Max wait for one outbound frame write
};

struct DispatchConfig {
    int reply_timeout_ms = 5000;  // Default wait for a device reply
    int max_timeout_ms = 60000;   // Upper bound for per-request timeout_ms
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RelayConfig {
    ServerConfig server;
    HttpConfig http;
    AuthConfig auth;
    ChannelConfig channel;
    DispatchConfig dispatch;
    LoggingConfig logging;
};

// Loads configuration from a YAML file (validates and applies environment overrides)
bool load_config(const std::string &config_path, RelayConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RelayConfig &config, std::string &error);

}  // namespace runtime
}  // namespace relay
