#include <catch2/catch.hpp>
#include "util/Logger.hpp"
#include "util/Profiler.hpp"
#include "core/MarshalContext.hpp"
#include "formats/JsonSerializer.hpp"
#include <sstream>
#include <thread>
#include <vector>

using namespace marshal::util;

namespace {

/**
 * Redirects the logger for the duration of a test
 */
class CapturedLog {
public:
    explicit CapturedLog(LogLevel level)
        : m_previousLevel(Logger::instance().getLevel()) {
        Logger::instance().setOutputStream(&m_stream);
        Logger::instance().setLevel(level);
    }

    ~CapturedLog() {
        Logger::instance().setOutputStream(nullptr);
        Logger::instance().setLevel(m_previousLevel);
    }

    std::string text() const { return m_stream.str(); }

private:
    std::ostringstream m_stream;
    LogLevel m_previousLevel;
};

} // namespace

// =============================================================================
// Logger
// =============================================================================

TEST_CASE("Logger filters below the configured level", "[Logger]") {
    CapturedLog log(LogLevel::WARN);
    LOG_DEBUG("hidden debug");
    LOG_INFO("hidden info");
    LOG_WARN("visible warning");
    LOG_ERROR("visible error");

    auto text = log.text();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("[WARN ] visible warning") != std::string::npos);
    REQUIRE(text.find("[ERROR] visible error") != std::string::npos);
}

TEST_CASE("Logger isEnabled follows level", "[Logger]") {
    CapturedLog log(LogLevel::INFO);
    REQUIRE_FALSE(Logger::instance().isEnabled(LogLevel::DEBUG));
    REQUIRE(Logger::instance().isEnabled(LogLevel::INFO));
    REQUIRE(Logger::instance().isEnabled(LogLevel::ERROR));
}

TEST_CASE("Logger level names", "[Logger]") {
    REQUIRE(Logger::stringToLevel("debug") == LogLevel::DEBUG);
    REQUIRE(Logger::stringToLevel("error") == LogLevel::ERROR);
    REQUIRE_THROWS_AS(Logger::stringToLevel("loud"), std::invalid_argument);
    REQUIRE(Logger::levelToString(LogLevel::DEBUG) == "DEBUG");
}

TEST_CASE("Logger truncates long messages", "[Logger]") {
    std::string longText(600, 'x');
    auto truncated = Logger::truncate(longText, 10);
    REQUIRE(truncated.substr(0, 10) == "xxxxxxxxxx");
    REQUIRE(truncated.find("total 600 bytes") != std::string::npos);
    REQUIRE(Logger::truncate("short") == "short");
}

TEST_CASE("Logger keeps lines whole across threads", "[Logger]") {
    CapturedLog log(LogLevel::INFO);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                LOG_INFO("thread " + std::to_string(t));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::istringstream lines(log.text());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        REQUIRE(line.find("[INFO ] thread ") != std::string::npos);
        ++count;
    }
    REQUIRE(count == 200);
}

// =============================================================================
// Profiler
// =============================================================================

TEST_CASE("Profiler records measurements per operation and media type", "[Profiler]") {
    auto& profiler = Profiler::instance();
    profiler.reset();
    profiler.setEnabled(true);
    {
        ProfileScope scope("serialize", "text/uon");
        scope.setBytes(10);
    }
    {
        ProfileScope scope("serialize", "text/uon");
        scope.setBytes(5);
    }
    {
        ProfileScope scope("parse", "text/uon");
        scope.setBytes(7);
    }
    profiler.setEnabled(false);

    auto serialize = profiler.getStats("serialize", "text/uon");
    REQUIRE(serialize.count == 2);
    REQUIRE(serialize.bytes == 15);
    REQUIRE(serialize.minMs <= serialize.maxMs);
    REQUIRE(profiler.getStats("parse", "text/uon").count == 1);
    REQUIRE(profiler.getStats("parse", "text/xml").count == 0);

    auto totals = profiler.getMediaTypeTotals("text/uon");
    REQUIRE(totals.count == 3);
    REQUIRE(totals.bytes == 22);

    std::string table = profiler.formatStats();
    REQUIRE(table.find("text/uon") != std::string::npos);
    REQUIRE(table.find("total") != std::string::npos);
    profiler.reset();
}

TEST_CASE("Profiler times serializers and parsers", "[Profiler]") {
    marshal::MarshalContext context;
    context.freeze();
    auto& profiler = Profiler::instance();
    profiler.reset();
    profiler.setEnabled(true);

    std::string json = marshal::formats::JsonSerializer().serialize(context, marshal::Pojo("abc"));
    REQUIRE(marshal::formats::JsonParser().parse(context, json) == marshal::Pojo("abc"));
    profiler.setEnabled(false);

    REQUIRE(profiler.getStats("serialize", "application/json").bytes == json.size());
    REQUIRE(profiler.getStats("parse", "application/json").bytes == json.size());
    REQUIRE(profiler.getMediaTypeTotals("application/json").count == 2);
    profiler.reset();
}

TEST_CASE("Profiler ignores measurements when disabled", "[Profiler]") {
    auto& profiler = Profiler::instance();
    profiler.reset();
    profiler.setEnabled(false);
    {
        ProfileScope scope("serialize", "text/xml");
        REQUIRE(scope.stop() == 0.0);
    }
    REQUIRE(profiler.getStats("serialize", "text/xml").count == 0);
    REQUIRE(profiler.formatStats() == "No profiling data available.");
}
