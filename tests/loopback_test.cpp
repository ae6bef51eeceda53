// ─────────────────────────────────────────────────────────────────────────────
// End-to-end Tests over a Loopback Transport
// ─────────────────────────────────────────────────────────────────────────────
// Requests travel the whole stack (validation, translation, transport,
// assembly, conversion) and come back as their own responses.

#include <catch2/catch_test_macros.hpp>

#include "wirecall/client/invocation.hpp"
#include "mocks/loopback_transport.hpp"

using namespace wirecall;
using namespace wirecall::testing;

TEST_CASE("Repeated headers survive the round trip", "[loopback]") {
    InvocationDispatcher dispatcher(std::make_shared<LoopbackTransport>());

    OutboundRequest request("GET", "http://example.test/echo");
    request.header("X-Tag", "alpha").header("x-tag", "beta").header("X-Single", "one");

    auto response = dispatcher.invoke(request);
    REQUIRE(response.has_value());
    const auto* tags = (*response)->headers().find("X-Tag");
    REQUIRE(tags != nullptr);
    REQUIRE(*tags == std::vector<std::string>{"alpha", "beta"});
    REQUIRE((*response)->headers().find("X-Single")->size() == 1);
    REQUIRE((*response)->headers().first("User-Agent") == "wirecall");
}

TEST_CASE("JSON entity round trip, synchronous", "[loopback]") {
    InvocationDispatcher dispatcher(std::make_shared<LoopbackTransport>());
    const Json document{{"items", {1, 2, 3}}, {"note", "ünïcode"}};

    OutboundRequest request("POST", "http://example.test/echo");
    request.entity(Entity::json(document));
    auto echoed = dispatcher.invoke<Json>(request);

    REQUIRE(echoed.has_value());
    REQUIRE(*echoed == document);
}

TEST_CASE("Streaming entity round trip, asynchronous", "[loopback]") {
    InvocationDispatcher dispatcher(std::make_shared<LoopbackTransport>(200, "OK", 1000));

    std::string expected;
    for (int i = 0; i < 300; ++i) {
        expected += "line " + std::to_string(i) + "\n";
    }
    OutboundRequest request("PUT", "http://example.test/upload");
    request.entity(Entity::streaming([&expected](EntitySink& sink) {
        for (std::size_t offset = 0; offset < expected.size(); offset += 512) {
            sink.write(std::string_view(expected).substr(offset, 512));
        }
    }, "text/plain"));

    auto pending = dispatcher.submit<std::string>(request);
    auto body = pending->get();
    REQUIRE(body.has_value());
    REQUIRE(*body == expected);
}

TEST_CASE("Custom reason phrase and resolved URI are kept", "[loopback]") {
    InvocationDispatcher dispatcher(std::make_shared<LoopbackTransport>(202, "Queued For Processing"));

    auto response = dispatcher.invoke(OutboundRequest("POST", "http://example.test/jobs"));
    REQUIRE((*response)->status() == 202);
    REQUIRE((*response)->reason() == "Queued For Processing");
    REQUIRE((*response)->resolved_uri() == "http://example.test/jobs");
}

TEST_CASE("Non-2xx loopback surfaces the echoed entity in the error", "[loopback]") {
    InvocationDispatcher dispatcher(std::make_shared<LoopbackTransport>(409, ""));

    OutboundRequest request("POST", "http://example.test/conflict");
    request.entity(Entity::text("duplicate key"));
    auto pending = dispatcher.submit<Json>(request);

    auto result = pending->get();
    REQUIRE(result.error().is(HttpStatusKind::ClientError));
    REQUIRE(result.error().response->reason() == "Conflict");
    REQUIRE(result.error().response->read_text().value() == "duplicate key");
}
