#include <catch2/catch_test_macros.hpp>
#include <inbetween/core/log.hpp>
#include <string>
#include <vector>

using namespace inbetween::core;

namespace {

struct CapturedLine {
    LogLevel level;
    std::string category;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void log(LogLevel level, const std::string& category, const std::string& message) override {
        lines.push_back({level, category, message});
    }

    std::vector<CapturedLine> lines;
};

// Registers the sink for one test and restores the level afterwards
class LogFixture {
protected:
    LogFixture() : m_previous(get_log_level()) {
        add_log_sink(&sink);
    }

    ~LogFixture() {
        remove_log_sink(&sink);
        set_log_level(m_previous);
    }

    CaptureSink sink;

private:
    LogLevel m_previous;
};

} // namespace

TEST_CASE_METHOD(LogFixture, "Log forwards to sinks with category", "[core][log]") {
    set_log_level(LogLevel::Trace);

    log(LogLevel::Warn, "[Compositor] Skipping element {} ({})", "cat", 3);

    REQUIRE(sink.lines.size() == 1);
    REQUIRE(sink.lines[0].level == LogLevel::Warn);
    REQUIRE(sink.lines[0].category == "Compositor");
    REQUIRE(sink.lines[0].message == "[Compositor] Skipping element cat (3)");
}

TEST_CASE_METHOD(LogFixture, "Log respects level filter", "[core][log]") {
    set_log_level(LogLevel::Error);

    log(LogLevel::Info, "dropped");
    log(LogLevel::Warn, "dropped too");
    log(LogLevel::Error, "kept");

    REQUIRE(sink.lines.size() == 1);
    REQUIRE(sink.lines[0].message == "kept");
    REQUIRE(sink.lines[0].category.empty());
}

TEST_CASE_METHOD(LogFixture, "Removed sinks receive nothing", "[core][log]") {
    set_log_level(LogLevel::Trace);
    remove_log_sink(&sink);

    log(LogLevel::Error, "nobody listens");

    REQUIRE(sink.lines.empty());
    add_log_sink(&sink); // fixture removes it again
}

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == LogLevel::Trace);
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("warn") == LogLevel::Warn);
    REQUIRE(parse_log_level("error") == LogLevel::Error);
    REQUIRE(parse_log_level("fatal") == LogLevel::Fatal);
    REQUIRE(parse_log_level("loud") == LogLevel::Info);
}
