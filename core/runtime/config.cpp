#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>

#include "../logging/logger.hpp"

namespace relay {
namespace runtime {

namespace {
bool valid_port(int port) { return port >= 1 && port <= 65535; }
}  // namespace

bool validate_config(const RelayConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.enabled) {
        if (!valid_port(config.http.port)) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
        if (config.http.port == config.channel.port) {
            error = "http.port and channel.port must differ";
            return false;
        }
    }

    // Validate auth settings
    if (config.auth.api_key.empty()) {
        error = "auth.api_key must not be empty";
        return false;
    }

    // Validate channel settings
    if (!valid_port(config.channel.port)) {
        error = "Channel port must be between 1 and 65535";
        return false;
    }
    if (config.channel.io_threads < 1) {
        error = "channel.io_threads must be at least 1";
        return false;
    }
    if (config.channel.path_prefix.empty() || config.channel.path_prefix.front() != '/' ||
        config.channel.path_prefix.back() != '/') {
        error = "channel.path_prefix must start and end with '/'";
        return false;
    }
    if (config.channel.max_message_bytes < 16) {
        error = "channel.max_message_bytes must be >= 16";
        return false;
    }
    if (config.channel.send_timeout_ms < 100) {
        error = "channel.send_timeout_ms must be >= 100ms";
        return false;
    }

    // Validate dispatch settings
    if (config.dispatch.reply_timeout_ms < 100) {
        error = "dispatch.reply_timeout_ms must be >= 100ms";
        return false;
    }
    if (config.dispatch.max_timeout_ms < config.dispatch.reply_timeout_ms) {
        error = "dispatch.max_timeout_ms (" + std::to_string(config.dispatch.max_timeout_ms) +
                ") must be >= reply_timeout_ms (" + std::to_string(config.dispatch.reply_timeout_ms) + ")";
        return false;
    }

    // Validate Logging settings
    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RelayConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"server", "http", "auth", "channel", "dispatch", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load server config
        if (yaml["server"]) {
            if (yaml["server"]["name"]) {
                config.server.name = yaml["server"]["name"].as<std::string>();
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["enabled"]) {
                config.http.enabled = http["enabled"].as<bool>();
            }
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load auth config
        if (yaml["auth"]) {
            if (yaml["auth"]["api_key"]) {
                config.auth.api_key = yaml["auth"]["api_key"].as<std::string>();
            }
            if (yaml["auth"]["api_key_env"]) {
                config.auth.api_key_env = yaml["auth"]["api_key_env"].as<std::string>();
            }
        }

        // Environment takes precedence over the file for the shared secret
        if (!config.auth.api_key_env.empty()) {
            const char *key_env = std::getenv(config.auth.api_key_env.c_str());
            if (key_env != nullptr && key_env[0] != '\0') {
                config.auth.api_key = key_env;
                LOG_INFO("[Config] API key taken from $" << config.auth.api_key_env);
            }
        }

        // Load channel config
        if (yaml["channel"]) {
            const auto &channel = yaml["channel"];
            if (channel["bind"]) {
                config.channel.bind = channel["bind"].as<std::string>();
            }
            if (channel["port"]) {
                config.channel.port = channel["port"].as<int>();
            }
            if (channel["path_prefix"]) {
                config.channel.path_prefix = channel["path_prefix"].as<std::string>();
            }
            if (channel["io_threads"]) {
                config.channel.io_threads = channel["io_threads"].as<int>();
            }
            if (channel["max_message_bytes"]) {
                config.channel.max_message_bytes = channel["max_message_bytes"].as<size_t>();
            }
            if (channel["send_timeout_ms"]) {
                config.channel.send_timeout_ms = channel["send_timeout_ms"].as<int>();
            }
        }

        // Load dispatch config
        if (yaml["dispatch"]) {
            if (yaml["dispatch"]["reply_timeout_ms"]) {
                config.dispatch.reply_timeout_ms = yaml["dispatch"]["reply_timeout_ms"].as<int>();
            }
            if (yaml["dispatch"]["max_timeout_ms"]) {
                config.dispatch.max_timeout_ms = yaml["dispatch"]["max_timeout_ms"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        if (config.auth.api_key == kPlaceholderApiKey) {
            LOG_WARN("[Config] Using the placeholder API key; set auth.api_key or $" << config.auth.api_key_env);
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ", " << config.http.thread_pool_size
                     << " workers)";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Channel: ws://" << config.channel.bind << ":" << config.channel.port
                                           << config.channel.path_prefix << "{device_id}");
        LOG_INFO("[Config] Reply timeout: " << config.dispatch.reply_timeout_ms << "ms (max "
                                            << config.dispatch.max_timeout_ms << "ms)");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace relay
