#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace relay {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Redirect output (nullptr restores stderr). Tests use this to capture log lines.
    static void set_stream(std::ostream *stream);

private:
    static Level threshold_;
    static std::ostream *stream_;
    static std::mutex mutex_;
};

// Helper to convert Level to string for config parsing
Level string_to_level(const std::string &level_str);
bool is_valid_level(const std::string &level_str);

}  // namespace logging
}  // namespace relay

// Macros to handle string building
#define RELAY_LOG_INTERNAL(lvl, msg)                                          \
    do {                                                                      \
        if ((lvl) >= relay::logging::Logger::level()) {                       \
            std::stringstream relay_log_ss;                                   \
            relay_log_ss << msg;                                              \
            relay::logging::Logger::log(lvl, __FILE__, __LINE__, relay_log_ss.str()); \
        }                                                                     \
    } while (0)

#define LOG_DEBUG(msg) RELAY_LOG_INTERNAL(relay::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) RELAY_LOG_INTERNAL(relay::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) RELAY_LOG_INTERNAL(relay::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) RELAY_LOG_INTERNAL(relay::logging::Level::LVL_ERROR, msg)
