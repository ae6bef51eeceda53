// ─────────────────────────────────────────────────────────────────────────────
// Executor Provider Selection Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "wirecall/client/client_config.hpp"
#include "wirecall/client/executor_provider.hpp"
#include "mocks/capturing_logger.hpp"

#include <asio/io_context.hpp>

using namespace wirecall;
using namespace wirecall::testing;

namespace {

ExecutorProvider provider(asio::io_context& ctx, std::string name, bool is_default, bool is_async) {
    return ExecutorProvider{std::move(name), ctx.get_executor(), is_default, is_async};
}

}  // namespace

TEST_CASE("Priority score favors async, then non-default", "[executor]") {
    asio::io_context ctx;
    REQUIRE(provider(ctx, "a", false, true).priority_score() == 3);
    REQUIRE(provider(ctx, "b", true, true).priority_score() == 2);
    REQUIRE(provider(ctx, "c", false, false).priority_score() == 1);
    REQUIRE(provider(ctx, "d", true, false).priority_score() == 0);
}

TEST_CASE("Highest score wins", "[executor]") {
    asio::io_context ctx;
    const std::vector<ExecutorProvider> providers{
        provider(ctx, "default-sync", true, false),
        provider(ctx, "custom-sync", false, false),
        provider(ctx, "default-async", true, true),
    };
    REQUIRE(select_executor_provider(providers)->name == "default-async");
}

TEST_CASE("Equal scores keep registration order", "[executor]") {
    asio::io_context ctx;
    const std::vector<ExecutorProvider> providers{
        provider(ctx, "first", false, true),
        provider(ctx, "second", false, true),
    };
    REQUIRE(select_executor_provider(providers)->name == "first");
}

TEST_CASE("No providers selects nothing", "[executor]") {
    REQUIRE_FALSE(select_executor_provider({}).has_value());
}

TEST_CASE("ClientConfig rejects unusable executor settings", "[executor][config]") {
    SECTION("provider without executor") {
        ClientConfig config;
        config.executor_providers.push_back(ExecutorProvider{"empty", {}, false, true});
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }
    SECTION("owned pool with zero threads") {
        ClientConfig config;
        config.with_async_threads(0);
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }
    SECTION("zero threads is fine with an explicit executor") {
        asio::io_context ctx;
        ClientConfig config;
        config.with_async_threads(0).with_executor(ctx.get_executor());
        REQUIRE_NOTHROW(config.validate());
    }
    SECTION("zero buffer cap") {
        ClientConfig config;
        config.with_async_max_buffered_bytes(0);
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }
}

TEST_CASE("Non-positive connector timeouts are ignored with a warning", "[executor][config]") {
    ScopedCapturingLogger capture(LogLevel::Warn);
    ClientConfig config;
    config.with_connect_timeout(std::chrono::milliseconds{0})
          .with_read_timeout(std::chrono::milliseconds{-250});

    REQUIRE_NOTHROW(config.validate());
    REQUIRE_FALSE(config.effective_connect_timeout().has_value());
    REQUIRE_FALSE(config.effective_read_timeout().has_value());
    REQUIRE(capture->contains(LogLevel::Warn, "connect timeout 0ms"));
    REQUIRE(capture->contains(LogLevel::Warn, "read timeout -250ms"));

    config.with_read_timeout(std::chrono::milliseconds{1500});
    REQUIRE(config.effective_read_timeout() == std::chrono::milliseconds{1500});
}
