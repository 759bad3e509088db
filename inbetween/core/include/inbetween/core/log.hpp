#pragma once

#include <format>
#include <string>
#include <utility>

namespace inbetween::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);

// Formatted logging, e.g. log(LogLevel::Warn, "[Compositor] Missing image: {}", ref)
template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    const std::string message = std::format(fmt, std::forward<Args>(args)...);
    log(level, message.c_str());
}

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parse "trace" / "debug" / "info" / "warn" / "error" / "fatal", falls back to Info
LogLevel parse_log_level(const std::string& name);

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

} // namespace inbetween::core
