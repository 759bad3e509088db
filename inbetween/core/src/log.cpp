#include <inbetween/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <vector>

namespace inbetween::core {

static std::atomic<LogLevel> s_log_level{LogLevel::Info};
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

// "[Compositor] message" -> "Compositor"
static std::string extract_category(const char* message) {
    if (!message || message[0] != '[') return {};
    const char* end = std::strchr(message, ']');
    if (!end) return {};
    return std::string(message + 1, end);
}

void log(LogLevel level, const char* message) {
    if (level < s_log_level.load()) return;
    if (!message) return;

    std::printf("%s\n", message);

    // Forward to registered sinks
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    if (s_log_sinks.empty()) return;

    const std::string category = extract_category(message);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level.load();
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    return LogLevel::Info;
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

} // namespace inbetween::core
