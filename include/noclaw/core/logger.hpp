/*
 * noclaw C++ - Logger
 *
 * Process-wide log sink shared by every execution. Lines are written to
 * stderr in one piece so concurrent executions never interleave output.
 * Colors are on only when stderr is a terminal and NO_COLOR is unset.
 */
#ifndef noclaw_CORE_LOGGER_HPP
#define noclaw_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>

namespace noclaw {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Unknown names leave `out` untouched and return false.
bool parse_log_level(const std::string& name, LogLevel& out);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void set_color(bool enabled);
    bool color() const;

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    bool color_;
    std::mutex write_mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) noclaw::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  noclaw::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  noclaw::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) noclaw::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace noclaw

#endif // noclaw_CORE_LOGGER_HPP
