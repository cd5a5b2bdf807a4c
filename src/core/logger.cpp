/*
 * warden C++17 - Logger Implementation
 */
#include <warden/core/logger.hpp>

namespace warden {

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

const LevelStyle kLevelStyles[] = {
    {"DEBUG", "\033[34m"},
    {"INFO",  "\033[32m"},
    {"WARN",  "\033[33m"},
    {"ERROR", "\033[31m"},
};

const char* kReset = "\033[0m";
const char* kFunctionColor = "\033[36m";
const char* kLocationColor = "\033[33m";

inline bool passes(LogLevel threshold, LogLevel level) {
    return level >= threshold;
}

const LevelStyle& style_for(LogLevel level) {
    size_t i = static_cast<size_t>(level);
    return kLevelStyles[i < 4 ? i : 1];
}

// "bool warden::PathGuard::validate(const std::string&, ...)" -> "PathGuard::validate"
std::string short_function_name(const char* pretty_function) {
    std::string sig(pretty_function);
    size_t paren = sig.find('(');
    if (paren != std::string::npos) sig.erase(paren);

    size_t space = sig.rfind(' ');
    if (space != std::string::npos) sig.erase(0, space + 1);
    while (!sig.empty() && (sig[0] == '*' || sig[0] == '&')) sig.erase(0, 1);

    const std::string ns = "warden::";
    if (sig.compare(0, ns.size(), ns) == 0) sig.erase(0, ns.size());

    // Drop template arguments of the enclosing class
    size_t lt = sig.find('<');
    size_t last = sig.rfind("::");
    if (lt != std::string::npos && last != std::string::npos && lt < last) {
        sig = sig.substr(0, lt) + sig.substr(last);
    }
    return sig;
}

} // anonymous namespace

#ifdef __GNUC__
__attribute__((visibility("default")))
#endif
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO), retention_(200) {}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

LogLevel Logger::parse_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::set_retention(size_t lines) {
    std::lock_guard<std::mutex> lock(recent_mutex_);
    retention_ = lines;
    while (recent_.size() > retention_) {
        recent_.pop_front();
    }
}

std::vector<std::string> Logger::recent_lines(size_t max_lines) const {
    std::lock_guard<std::mutex> lock(recent_mutex_);
    size_t count = max_lines < recent_.size() ? max_lines : recent_.size();
    return std::vector<std::string>(recent_.end() - static_cast<long>(count), recent_.end());
}

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (!passes(level_, LogLevel::DEBUG)) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (!passes(level_, LogLevel::INFO)) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (!passes(level_, LogLevel::WARN)) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (!passes(level_, LogLevel::ERROR)) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

void Logger::retain(const char* timestamp, const char* level_str, const std::string& message) {
    std::lock_guard<std::mutex> lock(recent_mutex_);
    if (retention_ == 0) return;
    recent_.push_back(std::string("[") + timestamp + "] [" + level_str + "] " + message);
    while (recent_.size() > retention_) {
        recent_.pop_front();
    }
}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func,
                      const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    char message[2048];
    vsnprintf(message, sizeof(message), fmt, args);

    const LevelStyle& style = style_for(level);
    fprintf(stderr, "[%s] %s[%s]%s ", timestamp, style.color, style.name, kReset);
    if (level_ == LogLevel::DEBUG) {
        fprintf(stderr, "%s(%s)%s at %s%s:%d%s ", kFunctionColor, short_function_name(func).c_str(),
                kReset, kLocationColor, file, line, kReset);
    }
    fprintf(stderr, "%s\n", message);
    fflush(stderr);

    retain(timestamp, style.name, message);
}

} // namespace warden
