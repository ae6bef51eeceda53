// ─────────────────────────────────────────────────────────────────────────────
// Logger Facade Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "wirecall/core/request_scope.hpp"
#include "wirecall/log/logger.hpp"
#include "mocks/capturing_logger.hpp"

#include <cstdint>
#include <memory>
#include <source_location>
#include <string_view>

using namespace wirecall;
using namespace wirecall::testing;

// ═══════════════════════════════════════════════════════════════════════════
// Levels and Records
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("LogLevel names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Error) == "ERROR");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("NullLogger drops everything", "[log]") {
    NullLogger logger;

    REQUIRE_FALSE(logger.should_log(LogLevel::Trace));
    REQUIRE_FALSE(logger.should_log(LogLevel::Error));

    logger.debug("ignored");
    logger.error_fmt("ignored {}", 1);
}

TEST_CASE("Records below the minimum level are filtered", "[log]") {
    CapturingLogger logger(LogLevel::Warn);

    logger.trace("t");
    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");

    const auto records = logger.records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].level == LogLevel::Warn);
    REQUIRE(records[0].message == "w");
    REQUIRE(records[1].level == LogLevel::Error);
}

TEST_CASE("Formatted records are rendered eagerly", "[log]") {
    CapturingLogger logger;
    logger.info_fmt("{} {} -> {}", "GET", "http://example.test/", 204);

    REQUIRE(logger.contains(LogLevel::Info, "GET http://example.test/ -> 204"));
}

TEST_CASE("LogRecord carries source location and timestamp", "[log]") {
    CapturingLogger logger;

    const auto before = std::chrono::system_clock::now();
    logger.info("located");
    const auto after = std::chrono::system_clock::now();

    const auto records = logger.records();
    REQUIRE(records.size() == 1);
    const std::string_view file(records[0].location.file_name());
    REQUIRE(file.find("logger_test") != std::string_view::npos);
    REQUIRE(records[0].location.line() > 0);
    REQUIRE(records[0].timestamp >= before);
    REQUIRE(records[0].timestamp <= after);
}

TEST_CASE("Formatted records point at the calling line", "[log]") {
    CapturingLogger logger;

    const auto here = std::source_location::current();
    logger.warn_fmt("sending {} after {}ms", "GET", 250);

    const auto records = logger.records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].message == "sending GET after 250ms");
    REQUIRE(std::string_view(records[0].location.file_name()) == std::string_view(here.file_name()));
    REQUIRE(records[0].location.line() == here.line() + 1);
}

TEST_CASE("Level names parse back case-insensitively", "[log]") {
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("WARN") == LogLevel::Warn);
    REQUIRE(parse_log_level("Warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("off") == LogLevel::Off);
    REQUIRE_FALSE(parse_log_level("").has_value());
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("information").has_value());
}

TEST_CASE("LevelFilter threshold can be raised and switched off", "[log]") {
    LevelFilter filter(LogLevel::Info);
    REQUIRE(filter.passes(LogLevel::Info));
    REQUIRE_FALSE(filter.passes(LogLevel::Debug));
    REQUIRE_FALSE(filter.passes(LogLevel::Off));

    filter.set_threshold(LogLevel::Off);
    REQUIRE_FALSE(filter.passes(LogLevel::Fatal));
    REQUIRE(filter.threshold() == LogLevel::Off);
}

TEST_CASE("Records inside a RequestScope carry its id", "[log]") {
    CapturingLogger logger;

    logger.info("outside");
    std::uint64_t scope_id = 0;
    {
        RequestScope scope("GET", "http://example.test/");
        scope_id = scope.context().id;
        logger.debug_fmt("inside {}", scope.context().method);
    }

    const auto records = logger.records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].request_id == 0);
    REQUIRE(scope_id != 0);
    REQUIRE(records[1].request_id == scope_id);
    REQUIRE(records[1].message == "inside GET");
}

// ═══════════════════════════════════════════════════════════════════════════
// Global Logger
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Global logger defaults to NullLogger", "[log]") {
    set_logger(nullptr);
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Error));
}

TEST_CASE("Scoped capturing logger replaces and restores the global logger", "[log]") {
    {
        ScopedCapturingLogger capture;
        get_logger().warn("swapped in");
        REQUIRE(capture->contains(LogLevel::Warn, "swapped in"));
    }
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Error));
}

TEST_CASE("A replaced logger stays usable through an earlier reference", "[log]") {
    auto first = std::make_unique<CapturingLogger>();
    CapturingLogger* first_raw = first.get();
    set_logger(std::move(first));
    ILogger& held = get_logger();

    set_logger(std::make_unique<CapturingLogger>());
    held.warn("late record");

    REQUIRE(first_raw->contains(LogLevel::Warn, "late record"));
    set_logger(nullptr);
}

TEST_CASE("WIRECALL_LOG macros honor the level", "[log]") {
    ScopedCapturingLogger capture(LogLevel::Debug);

    WIRECALL_LOG_TRACE("trace");
    WIRECALL_LOG_DEBUG("debug");
    WIRECALL_LOG_INFO("info");
    WIRECALL_LOG_WARN("warn");
    WIRECALL_LOG_ERROR("error");

    const auto records = capture->records();
    REQUIRE(records.size() == 4);
    REQUIRE(records[0].level == LogLevel::Debug);
    REQUIRE(records[3].level == LogLevel::Error);
    REQUIRE(records[3].message == "error");
}
