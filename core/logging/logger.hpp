#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace vibium {
namespace logging {

enum class Level {
    LVL_TRACE,
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Cheap pre-check so the macros skip message formatting below threshold
    static bool enabled(Level level) { return level >= threshold_.load(std::memory_order_relaxed); }

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Helpers for config parsing ("trace", "debug", "info", "warn", "error", "none")
Level string_to_level(const std::string &level_str);
std::string level_to_string(Level level);
bool is_valid_level(const std::string &level_str);

}  // namespace logging
}  // namespace vibium

#define LOG_INTERNAL(level, msg)                                                 \
    do {                                                                         \
        if (vibium::logging::Logger::enabled(level)) {                           \
            std::stringstream ss;                                                \
            ss << msg;                                                           \
            vibium::logging::Logger::log(level, __FILE__, __LINE__, ss.str());   \
        }                                                                        \
    } while (0)

#define LOG_TRACE(msg) LOG_INTERNAL(vibium::logging::Level::LVL_TRACE, msg)
#define LOG_DEBUG(msg) LOG_INTERNAL(vibium::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(vibium::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(vibium::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(vibium::logging::Level::LVL_ERROR, msg)
