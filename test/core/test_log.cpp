#include <catch2/catch_test_macros.hpp>

#include <asc_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace asc_mcp;

namespace {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

} // anonymous namespace

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: known names, any case", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("Warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK_FALSE(ParseLogLevel("verbose").has_value());
}

// ===========================================================================
// Sinks
// ===========================================================================

TEST_CASE("StderrSink: writes level, component and message", "[log]") {
    std::ostringstream oss;
    StderrSink sink(oss);
    sink.Write(LogLevel::Warn, "http", "slow response");

    auto line = oss.str();
    CHECK(line.find("[WARN] [http] slow response") != std::string::npos);
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    sink.Write(LogLevel::Info, "mcp", "initialized");
    sink.Write(LogLevel::Debug, "auth", "line1\nline2 \"quoted\"");

    std::istringstream lines(oss.str());
    std::string line;
    std::vector<nlohmann::json> parsed;
    while (std::getline(lines, line)) {
        parsed.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(parsed.size() == 2);
    CHECK(parsed[0]["level"] == "INFO");
    CHECK(parsed[0]["component"] == "mcp");
    CHECK(parsed[0]["message"] == "initialized");
    CHECK(parsed[0].contains("ts"));
    CHECK(parsed[1]["message"] == "line1\nline2 \"quoted\"");
}

TEST_CASE("JsonSink: invalid UTF-8 does not throw", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    CHECK_NOTHROW(sink.Write(LogLevel::Info, "http", std::string("bad \xff byte")));
    CHECK_FALSE(oss.str().empty());
}

TEST_CASE("FileSink: appends lines to a file", "[log]") {
    auto path = std::filesystem::temp_directory_path() / "asc_mcp_test_file_sink.log";
    std::filesystem::remove(path);
    {
        FileSink sink(path.string());
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Error, "main", "first");
        sink.Write(LogLevel::Error, "main", "second");
    }
    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    auto text = contents.str();
    CHECK(std::count(text.begin(), text.end(), '\n') == 2);
    CHECK(text.find("[ERROR] [main] second") != std::string::npos);
    std::filesystem::remove(path);
}

TEST_CASE("FileSink: unopenable path reports closed", "[log]") {
    FileSink sink("/nonexistent-dir/asc-mcp.log");
    CHECK_FALSE(sink.IsOpen());
    CHECK_NOTHROW(sink.Write(LogLevel::Error, "main", "dropped"));
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "filtered");
    logger.Info("c", "filtered");
    logger.Warn("c", "kept");
    logger.Error("c", "kept");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    CHECK_FALSE(logger.IsEnabled(LogLevel::Debug));
    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.IsEnabled(LogLevel::Debug));
    logger.Debug("c", "now visible");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "now visible");
}

TEST_CASE("Logger: concurrent writers do not lose messages", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger] {
            for (int i = 0; i < 100; ++i) {
                logger.Info("worker", "tick");
            }
        });
    }
    for (auto& t : threads) t.join();
    CHECK(sink_ptr->messages.size() == 400);
}

TEST_CASE("Global logger: routes free functions to installed sink", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("g", "filtered");
    LogInfo("g", "info");
    LogWarn("g", "warn");
    LogError("g", "error");

    REQUIRE(sink_ptr->messages.size() == 3);
    CHECK(sink_ptr->messages[0].component == "g");

    // Leave a quiet logger behind for other tests.
    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
