#ifndef sandforge_CORE_LOGGER_HPP
#define sandforge_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace sandforge {

// Visibility attribute for symbols shared with test binaries and tools
#ifdef __GNUC__
#  define SANDFORGE_LOGGER_API __attribute__((visibility("default")))
#else
#  define SANDFORGE_LOGGER_API
#endif

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

// Parse "debug" / "info" / "warn" / "error" / "off". Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

class SANDFORGE_LOGGER_API Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;

    // ANSI colors; defaults to on when stderr is a terminal
    void set_color(bool enabled);
    
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
};

// Convenience macros
#define LOG_DEBUG(...) sandforge::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  sandforge::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  sandforge::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) sandforge::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace sandforge

#endif // sandforge_CORE_LOGGER_HPP
