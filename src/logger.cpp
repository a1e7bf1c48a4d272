#include "logger.h"
#include <algorithm>
#include <cctype>

namespace bridgelink {

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::WARN;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true) {
    // Check if we're outputting to a terminal
    is_terminal_ = isatty(fileno(stdout));

    // On Windows, enable ANSI color codes
#ifdef _WIN32
    if (is_terminal_) {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        DWORD dwMode = 0;
        GetConsoleMode(hOut, &dwMode);
        dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        SetConsoleMode(hOut, dwMode);
    }
#endif
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::ostringstream oss;

    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
#ifdef _WIN32
        localtime_s(&local_tm, &time_t);
#else
        localtime_r(&time_t, &local_tm);
#endif
        oss << "[" << std::put_time(&local_tm, "%H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    if (colors_enabled_ && is_terminal_) {
        oss << get_color_code(level) << "[" << get_level_string(level) << "]" << get_reset_code();
    } else {
        oss << "[" << get_level_string(level) << "]";
    }

    if (!module.empty()) {
        if (colors_enabled_ && is_terminal_) {
            oss << " " << get_module_color(module) << "[" << module << "]" << get_reset_code();
        } else {
            oss << " [" << module << "]";
        }
    }

    oss << " " << message << std::endl;

    // Errors go to stderr so that CLI output on stdout stays parseable
    if (level >= LogLevel::ERROR) {
        std::cerr << oss.str();
        std::cerr.flush();
    } else {
        std::cout << oss.str();
        std::cout.flush();
    }
}

std::string Logger::get_level_string(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_color_code(LogLevel level) const {
    if (!colors_enabled_ || !is_terminal_) return "";

    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

std::string Logger::get_module_color(const std::string& module) const {
    if (!colors_enabled_ || !is_terminal_) return "";

    const char* colors[] = {
        "\033[35m",  // Magenta
        "\033[94m",  // Bright Blue
        "\033[95m",  // Bright Magenta
        "\033[96m",  // Bright Cyan
        "\033[93m",  // Bright Yellow
        "\033[92m",  // Bright Green
        "\033[90m",  // Gray
        "\033[34m",  // Blue
        "\033[38;5;208m", // Orange
        "\033[38;5;141m", // Purple
        "\033[38;5;51m",  // Turquoise
    };

    size_t color_count = sizeof(colors) / sizeof(colors[0]);
    return colors[hash_string(module) % color_count];
}

std::string Logger::get_reset_code() const {
    if (!colors_enabled_ || !is_terminal_) return "";
    return "\033[0m";
}

uint32_t Logger::hash_string(const std::string& str) {
    uint32_t hash = 5381;
    for (char c : str) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c); // hash * 33 + c
    }
    return hash;
}

} // namespace bridgelink
