#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include "core/Types.hpp"

namespace LoOP {
namespace Utils {

/**
 * @brief Singleton Logger shared by the library and the command-line tool.
 *
 * ERROR and WARN records go to stderr, the rest to stdout. ANSI colors are
 * used only when the target stream is a terminal.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);

    /**
     * @brief Mirrors every record (without colors) to a file, appending.
     */
    void set_log_file(const std::string& filename);
    void set_color_enabled(bool enabled);

    // Core logging function
    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    // Static helpers for cleaner syntax
    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    bool color_stdout_ = false;
    bool color_stderr_ = false;
    std::ofstream log_file_;
    std::mutex mutex_;

    static const char* level_to_string(LogLevel level);
    static const char* color_code(LogLevel level);
};

/**
 * @brief RAII helper to log start and end of a scope/action.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace LoOP

// Macros to automatically capture file and line number
#define LOG_DEBUG(msg) LoOP::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) LoOP::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) LoOP::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) LoOP::Utils::Logger::error(msg, __FILE__, __LINE__)
