#include <sandforge/core/logger.hpp>

#include <cstdlib>
#include <mutex>
#include <unistd.h>

namespace sandforge {

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

LevelStyle style_of(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return {"DEBUG", "\033[34m"};
        case LogLevel::INFO:  return {"INFO",  "\033[32m"};
        case LogLevel::WARN:  return {"WARN",  "\033[33m"};
        case LogLevel::ERROR: return {"ERROR", "\033[31m"};
        default:              return {"?",     "\033[0m"};
    }
}

const char* const RESET = "\033[0m";
const char* const FUNCTION_COLOR = "\033[36m";
const char* const LOCATION_COLOR = "\033[33m";

// Escape codes only when a person is watching; NO_COLOR opts out
bool stderr_wants_color() {
    const char* no_color = getenv("NO_COLOR");
    if (no_color && no_color[0] != '\0') return false;
    return isatty(fileno(stderr)) == 1;
}

} // namespace

// Serializes writes from provider worker threads and the main loop
static std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

static std::pair<std::string, std::string> extract_class_and_function(const char* pretty_function) {
    std::string pf = pretty_function;

    size_t paren_pos = pf.find('(');
    if (paren_pos == std::string::npos) {
        return {"", ""}; // Malformed
    }

    // Extract function signature up to parameters
    std::string signature = pf.substr(0, paren_pos);

    size_t last_colon = signature.rfind("::");
    if (last_colon == std::string::npos) {
        // No class, just function name - find last space
        size_t space_pos = signature.rfind(' ');
        std::string func_name = (space_pos != std::string::npos) ? signature.substr(space_pos + 1) : signature;
        return {"", func_name};
    }

    std::string func_name = signature.substr(last_colon + 2);

    // Class name is everything before the last ::, after the return type
    std::string before_last_colon = signature.substr(0, last_colon);
    size_t space_pos = before_last_colon.rfind(' ');
    std::string class_name;
    if (space_pos != std::string::npos) {
        class_name = before_last_colon.substr(space_pos + 1);
    } else {
        class_name = before_last_colon;
    }

    size_t template_pos = class_name.find('<');
    if (template_pos != std::string::npos) {
        class_name = class_name.substr(0, template_pos);
    }

    if (!class_name.empty() && class_name[0] == '*') {
        class_name = class_name.substr(1);
    }

    // Drop the project namespace, keep nested ones (plugins::Foo)
    if (class_name.find("sandforge::") == 0) {
        class_name = class_name.substr(11);
    }

    return {class_name, func_name};
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off" || name == "none") return LogLevel::OFF;
    return LogLevel::INFO;
}

// Force visibility for the singleton across shared library boundaries
#ifdef __GNUC__
__attribute__((visibility("default")))
#endif
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

Logger::Logger() : level_(LogLevel::INFO), color_(stderr_wants_color()) {}

void Logger::set_color(bool enabled) { color_ = enabled; }

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    LevelStyle style = style_of(level);
    const char* color = color_ ? style.color : "";
    const char* reset = color_ ? RESET : "";
    auto [class_name, func_name] = extract_class_and_function(func);

    std::lock_guard<std::mutex> lock(output_mutex());
    fprintf(stderr, "[%s] %s[%s]%s ", timestamp, color, style.name, reset);
    if (level_ == LogLevel::DEBUG) {
        // Call site, as (Class::method) at file:line
        fprintf(stderr, "%s(%s%s%s)%s at %s%s:%d%s ",
                color_ ? FUNCTION_COLOR : "",
                class_name.c_str(), class_name.empty() ? "" : "::", func_name.c_str(),
                reset, color_ ? LOCATION_COLOR : "", file, line, reset);
    }
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
    fflush(stderr);
}

} // namespace sandforge
