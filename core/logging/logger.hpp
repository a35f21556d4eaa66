#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace ascot {
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
    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Parse a config level name ("debug", "info", "warn", "error", "none").
// Unrecognized names fall back to INFO.
Level string_to_level(const std::string& level_str);

// True when level_str names a level string_to_level understands.
bool is_valid_level(const std::string& level_str);

} // namespace logging
} // namespace ascot

#define ASCOT_LOG_INTERNAL(level, msg) \
    do { \
        std::stringstream ascot_log_ss_; \
        ascot_log_ss_ << msg; \
        ascot::logging::Logger::log(level, __FILE__, __LINE__, ascot_log_ss_.str()); \
    } while(0)

#define LOG_DEBUG(msg) ASCOT_LOG_INTERNAL(ascot::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  ASCOT_LOG_INTERNAL(ascot::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  ASCOT_LOG_INTERNAL(ascot::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) ASCOT_LOG_INTERNAL(ascot::logging::Level::LVL_ERROR, msg)
