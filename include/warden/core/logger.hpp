/*
 * warden C++17 - Logger
 *
 * Process-wide printf-style logger. Lines go to stderr with a colored level
 * tag; the most recent lines are also retained in memory so that forensic
 * evidence bundles can include them.
 */
#ifndef warden_CORE_LOGGER_HPP
#define warden_CORE_LOGGER_HPP

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace warden {

// Visibility attribute for symbols shared across library boundaries
#ifdef __GNUC__
#  define WARDEN_LOGGER_API __attribute__((visibility("default")))
#else
#  define WARDEN_LOGGER_API
#endif

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class WARDEN_LOGGER_API Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;

    // Parse "debug" / "info" / "warn" / "error"; unknown names keep INFO.
    static LogLevel parse_level(const std::string& name);

    // Number of formatted lines kept in memory (0 disables retention)
    void set_retention(size_t lines);

    // Most recent retained lines, oldest first
    std::vector<std::string> recent_lines(size_t max_lines) const;
    
    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);
    void retain(const char* timestamp, const char* level_str, const std::string& message);
    
    LogLevel level_;
    size_t retention_;
    mutable std::mutex recent_mutex_;
    std::deque<std::string> recent_;
};

// Convenience macros
#define LOG_DEBUG(...) warden::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  warden::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  warden::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) warden::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace warden

#endif // warden_CORE_LOGGER_HPP
