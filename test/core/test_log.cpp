#include <catch2/catch_test_macros.hpp>

#include <peppol_lookup/core/log.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace peppol_lookup;

namespace {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<CapturedMessage>& out) : out_(out) {}
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        out_.push_back({level, std::string(component), std::string(message)});
    }

private:
    std::vector<CapturedMessage>& out_;
};

} // anonymous namespace

TEST_CASE("LogLevelFromVerbosity: maps -v counts", "[core][log]") {
    CHECK(LogLevelFromVerbosity(0) == LogLevel::Warn);
    CHECK(LogLevelFromVerbosity(1) == LogLevel::Info);
    CHECK(LogLevelFromVerbosity(2) == LogLevel::Debug);
    CHECK(LogLevelFromVerbosity(5) == LogLevel::Debug);
}

TEST_CASE("JsonSink: writes one JSON object per line", "[core][log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "sml", "say \"hi\"\n");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"sml\"") != std::string::npos);
    CHECK(line.find("\"message\":\"say \\\"hi\\\"\\n\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    CHECK(line.back() == '\n');
}

TEST_CASE("ColorConsoleSink: plain format without color", "[core][log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Warn, "smp", "slow answer");

    auto line = oss.str();
    CHECK(line.find("[WARN] [smp] slow answer") != std::string::npos);
    CHECK(line.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: ANSI format with color", "[core][log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "lookup", "failed");

    auto line = oss.str();
    CHECK(line.find("\033[") != std::string::npos);
    CHECK(line.find("failed") != std::string::npos);
}

TEST_CASE("Logger: filters below minimum level", "[core][log]") {
    std::vector<CapturedMessage> messages;
    Logger logger(std::make_unique<CaptureSink>(messages), LogLevel::Info);

    logger.Debug("dns", "hidden");
    logger.Info("dns", "shown");
    logger.Error("dns", "also shown");

    REQUIRE(messages.size() == 2);
    CHECK(messages[0].message == "shown");
    CHECK(messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: concurrent writers", "[core][log]") {
    std::vector<CapturedMessage> messages;
    Logger logger(std::make_unique<CaptureSink>(messages), LogLevel::Debug);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < 50; ++i) {
                logger.Info("worker", std::to_string(t));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    CHECK(messages.size() == 200);
}

TEST_CASE("GlobalLogger: free functions reach the installed sink", "[core][log]") {
    std::vector<CapturedMessage> messages;
    InitGlobalLogger(std::make_unique<CaptureSink>(messages), LogLevel::Debug);

    LogDebug("config", "d");
    LogWarn("config", "w");
    CHECK(messages.size() == 2);

    // Leave a quiet logger behind for the other tests.
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(false), LogLevel::Error);
}
