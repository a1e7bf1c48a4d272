#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>

#ifdef _WIN32
    #include <windows.h>
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
    // Undefine Windows ERROR macro to avoid conflicts with our enum
    #ifdef ERROR
        #undef ERROR
    #endif
#else
    #include <unistd.h>
#endif

namespace bridgelink {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse a level name ("debug", "info", "warn"/"warning", "error"), case-insensitive.
 * @param name Level name
 * @param level Output level, untouched when the name is not recognised
 * @return true if the name was recognised
 */
bool parse_log_level(const std::string& name, LogLevel& level);

class Logger {
public:
    // Singleton pattern
    static Logger& getInstance();

    // Delete copy constructor and assignment operator
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Set the minimum log level
    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_log_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    // Enable/disable colors
    void set_colors_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colors_enabled_ = enabled;
    }

    // Enable/disable timestamps
    void set_timestamps_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamps_enabled_ = enabled;
    }

    bool is_enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_;
    }

    // Main logging function
    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    std::string get_level_string(LogLevel level) const;
    std::string get_color_code(LogLevel level) const;
    std::string get_module_color(const std::string& module) const;
    std::string get_reset_code() const;

    // Simple hash function for strings
    static uint32_t hash_string(const std::string& str);

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
};

} // namespace bridgelink

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        if (bridgelink::Logger::getInstance().is_enabled(bridgelink::LogLevel::DEBUG)) { \
            std::ostringstream oss; \
            oss << message; \
            bridgelink::Logger::getInstance().log(bridgelink::LogLevel::DEBUG, module, oss.str()); \
        } \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        bridgelink::Logger::getInstance().log(bridgelink::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        bridgelink::Logger::getInstance().log(bridgelink::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        bridgelink::Logger::getInstance().log(bridgelink::LogLevel::ERROR, module, oss.str()); \
    } while(0)
