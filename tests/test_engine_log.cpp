#include <catch2/catch_test_macros.hpp>
#include "engine_log.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace logwindow;

namespace {

struct Captured {
    LogLevel level;
    std::string component;
    std::string message;
};

} // namespace

TEST_CASE("EngineLog routes messages to the installed sink", "[log]") {
    std::vector<Captured> captured;
    EngineLog::set_sink([&captured](LogLevel level, const std::string& component,
                                    const std::string& message) {
        captured.push_back({level, component, message});
    });
    EngineLog::set_level(LogLevel::Info);

    EngineLog::debug("Test", "hidden");
    EngineLog::info("Test", "shown");
    EngineLog::warning("Tailer", "careful");
    EngineLog::error("Tailer", "broken");

    REQUIRE(captured.size() == 3);
    REQUIRE(captured[0].level == LogLevel::Info);
    REQUIRE(captured[0].message == "shown");
    REQUIRE(captured[1].level == LogLevel::Warning);
    REQUIRE(captured[2].component == "Tailer");
    REQUIRE(captured[2].message == "broken");

    SECTION("Lowering the level lets debug through") {
        EngineLog::set_level(LogLevel::Debug);
        EngineLog::debug("Test", "now visible");
        REQUIRE(captured.back().message == "now visible");
        REQUIRE(EngineLog::level() == LogLevel::Debug);
    }

    SECTION("Raising the level filters warnings") {
        EngineLog::set_level(LogLevel::Error);
        EngineLog::warning("Test", "dropped");
        REQUIRE(captured.size() == 3);
    }

    EngineLog::set_sink(nullptr);
    EngineLog::set_level(LogLevel::Info);
}

TEST_CASE("Log level names", "[log]") {
    REQUIRE(std::string(log_level_name(LogLevel::Debug)) == "DEBUG");
    REQUIRE(std::string(log_level_name(LogLevel::Info)) == "INFO");
    REQUIRE(std::string(log_level_name(LogLevel::Warning)) == "WARNING");
    REQUIRE(std::string(log_level_name(LogLevel::Error)) == "ERROR");
}

TEST_CASE("Console sink tags lines with the component", "[log]") {
    std::ostringstream out;
    std::ostringstream err;
    auto* old_out = std::cout.rdbuf(out.rdbuf());
    auto* old_err = std::cerr.rdbuf(err.rdbuf());

    EngineLog::console_sink(LogLevel::Info, "Tailer", "started");
    EngineLog::console_sink(LogLevel::Error, "Tailer", "broken");

    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);

    REQUIRE(out.str() == "[Tailer] started\n");
    REQUIRE(err.str() == "[Tailer] broken\n");
}
