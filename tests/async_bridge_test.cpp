// ─────────────────────────────────────────────────────────────────────────────
// Non-blocking Connector Tests
// ─────────────────────────────────────────────────────────────────────────────
// HttpConnector::apply(request, callback) against scripted exchanges. The
// mock delivers events on the test thread, so every step is deterministic.

#include <catch2/catch_test_macros.hpp>

#include "wirecall/connector/connector.hpp"
#include "mocks/capturing_logger.hpp"
#include "mocks/mock_transport.hpp"

#include <mutex>

using namespace wirecall;
using namespace wirecall::testing;

namespace {

// Records every callback invocation.
struct ResponseRecorder {
    std::mutex mutex;
    int responses{0};
    int failures{0};
    ResponsePtr response;
    std::optional<InvocationError> error;

    ResponseCallback callback() {
        ResponseCallback cb;
        cb.on_response = [this](ResponsePtr r) {
            std::lock_guard<std::mutex> lock(mutex);
            ++responses;
            response = std::move(r);
        };
        cb.on_failure = [this](const InvocationError& e) {
            std::lock_guard<std::mutex> lock(mutex);
            ++failures;
            error = e;
        };
        return cb;
    }

    int calls() {
        std::lock_guard<std::mutex> lock(mutex);
        return responses + failures;
    }
};

struct Fixture {
    std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
    ResponseRecorder recorder;

    HttpConnector make_connector(ClientConfig config = {}) {
        return HttpConnector(transport, std::move(config));
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Successful Exchanges
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Chunked response completes pending and callback once", "[bridge]") {
    Fixture f;
    HttpConnector connector(f.transport, ClientConfig{}.with_entity_processing(EntityProcessing::Chunked));

    const std::string payload(2048, 'p');
    OutboundRequest request("PUT", "http://example.test/objects/1");
    request.entity(Entity::bytes(payload, "application/octet-stream"));

    auto pending = connector.apply(request, f.recorder.callback());
    auto exchange = f.transport->wait_for_exchange();
    REQUIRE(exchange != nullptr);
    REQUIRE(f.transport->last_request().streaming);
    REQUIRE(f.transport->last_request().body == payload);
    REQUIRE_FALSE(pending->is_done());

    exchange->headers(200, {{"Content-Type", "application/octet-stream"}});
    exchange->data(payload.substr(0, 700));
    exchange->data(payload.substr(700, 700));
    exchange->data(payload.substr(1400));
    REQUIRE_FALSE(pending->is_done());
    exchange->complete(std::string("http://example.test/objects/1?v=2"));

    REQUIRE(f.recorder.responses == 1);
    REQUIRE(f.recorder.failures == 0);
    auto result = pending->get();
    REQUIRE(result.has_value());
    REQUIRE(*result == f.recorder.response);
    REQUIRE((*result)->status() == 200);
    REQUIRE((*result)->reason() == "OK");
    REQUIRE((*result)->resolved_uri() == "http://example.test/objects/1?v=2");
    REQUIRE((*result)->read_text().value() == payload);
}

TEST_CASE("Buffered PUT resolves to the three chunks in order", "[bridge]") {
    Fixture f;
    HttpConnector connector(f.transport, ClientConfig{}.with_entity_processing(EntityProcessing::Buffered));

    std::string payload;
    for (int i = 0; i < 2048; ++i) {
        payload.push_back(static_cast<char>('a' + i % 26));
    }
    OutboundRequest request("PUT", "http://example.test/objects/2");
    request.entity(Entity::bytes(payload, "application/octet-stream"));

    auto pending = connector.apply(request, f.recorder.callback());
    auto exchange = f.transport->wait_for_exchange();
    REQUIRE(exchange != nullptr);
    const auto sent = f.transport->last_request();
    REQUIRE(sent.has_body);
    REQUIRE_FALSE(sent.streaming);
    REQUIRE(sent.body == payload);
    REQUIRE(sent.declared_length == payload.size());

    const std::string first = "first-";
    const std::string second = "second-";
    const std::string third = "third";
    exchange->headers(200);
    exchange->data(first);
    exchange->data(second);
    exchange->data(third);
    REQUIRE_FALSE(pending->is_done());
    exchange->complete();

    auto result = pending->get();
    REQUIRE(result.has_value());
    REQUIRE((*result)->status() == 200);
    REQUIRE((*result)->read_text().value() == "first-second-third");
    REQUIRE(f.recorder.responses == 1);
    REQUIRE(f.recorder.failures == 0);
}

TEST_CASE("Status codes are not interpreted by the connector", "[bridge]") {
    Fixture f;
    auto connector = f.make_connector();

    auto pending = connector.apply(OutboundRequest("GET", "http://example.test/"), f.recorder.callback());
    f.transport->wait_for_exchange()->respond(404, {}, {"missing"});

    REQUIRE(pending->state() == InvocationState::Completed);
    REQUIRE(pending->get().value()->status() == 404);
    REQUIRE(f.recorder.responses == 1);
}

TEST_CASE("A throwing callback does not prevent completion", "[bridge]") {
    ScopedCapturingLogger capture(LogLevel::Error);
    Fixture f;
    auto connector = f.make_connector();

    ResponseCallback callback;
    callback.on_response = [](ResponsePtr) { throw std::runtime_error("handler bug"); };
    auto pending = connector.apply(OutboundRequest("GET", "http://example.test/"), callback);
    f.transport->wait_for_exchange()->respond(200, {}, {});

    REQUIRE(pending->state() == InvocationState::Completed);
    REQUIRE(capture->contains(LogLevel::Error, "handler bug"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Callback and pending share the failure cause", "[bridge][failure]") {
    Fixture f;
    auto connector = f.make_connector();

    auto pending = connector.apply(OutboundRequest("GET", "http://example.test/"), f.recorder.callback());
    auto cause = std::make_shared<const TransportFault>(TransportFault::connection_failed("refused"));
    f.transport->wait_for_exchange()->fail(cause);

    REQUIRE(f.recorder.failures == 1);
    auto result = pending->get();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::Transport);
    REQUIRE(result.error().cause == cause);
    REQUIRE(f.recorder.error->cause.get() == result.error().cause.get());
}

TEST_CASE("Failure after headers fails the pending invocation", "[bridge][failure]") {
    Fixture f;
    auto connector = f.make_connector();

    auto pending = connector.apply(OutboundRequest("GET", "http://example.test/"), f.recorder.callback());
    auto exchange = f.transport->wait_for_exchange();
    exchange->headers(200);
    exchange->data("partial");
    exchange->fail(TransportFault::timeout("read timed out"));
    exchange->data("ignored");
    exchange->complete();

    REQUIRE(pending->state() == InvocationState::Failed);
    REQUIRE(pending->get().error().cause->code == TransportFault::Code::Timeout);
    REQUIRE(f.recorder.calls() == 1);
}

TEST_CASE("Registration failure is reported like a transport failure", "[bridge][failure]") {
    Fixture f;
    f.transport->set_throw_on_send_async(true);
    auto connector = f.make_connector();

    auto pending = connector.apply(OutboundRequest("GET", "http://example.test/"), f.recorder.callback());

    REQUIRE(pending->state() == InvocationState::Failed);
    REQUIRE(f.recorder.failures == 1);
    REQUIRE(f.recorder.error->code == ErrorCode::Transport);
    REQUIRE(f.recorder.error->message.find("exchange registry full") != std::string::npos);
}

TEST_CASE("Exceeding the buffer cap aborts the exchange", "[bridge][failure]") {
    Fixture f;
    auto connector = f.make_connector(ClientConfig{}.with_async_max_buffered_bytes(1024));

    auto pending = connector.apply(OutboundRequest("GET", "http://example.test/big"), f.recorder.callback());
    auto exchange = f.transport->wait_for_exchange();
    exchange->headers(200);
    exchange->data(std::string(1000, 'a'));
    exchange->data(std::string(1000, 'b'));
    exchange->complete();

    REQUIRE(exchange->was_aborted());
    REQUIRE(pending->state() == InvocationState::Failed);
    REQUIRE(pending->get().error().cause->code == TransportFault::Code::ResponseTooLarge);
    REQUIRE(f.recorder.failures == 1);
    REQUIRE(f.recorder.calls() == 1);
}

TEST_CASE("Translation errors fail at once without an exchange", "[bridge][failure]") {
    Fixture f;
    auto connector = f.make_connector();

    OutboundRequest request("GET", "http://example.test/");
    request.property(property::ReadTimeout, "soon");
    auto pending = connector.apply(request, f.recorder.callback());

    REQUIRE(pending->get().error().code == ErrorCode::Configuration);
    REQUIRE(f.recorder.failures == 1);
    REQUIRE(f.transport->exchange_count() == 0);
}

TEST_CASE("Closed connector fails new exchanges", "[bridge][failure]") {
    Fixture f;
    auto connector = f.make_connector();
    connector.close();

    auto pending = connector.apply(OutboundRequest("GET", "http://example.test/"), f.recorder.callback());

    REQUIRE(pending->get().error().cause->code == TransportFault::Code::Closed);
    REQUIRE(f.recorder.failures == 1);
    REQUIRE(f.transport->close_count() == 1);

    auto sync = connector.apply(OutboundRequest("GET", "http://example.test/"));
    REQUIRE(sync.error().cause->code == TransportFault::Code::Closed);
}

// ═══════════════════════════════════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Cancel before headers aborts and reports once", "[bridge][cancel]") {
    Fixture f;
    auto connector = f.make_connector();

    auto pending = connector.apply(OutboundRequest("GET", "http://example.test/slow"), f.recorder.callback());
    auto exchange = f.transport->wait_for_exchange();

    REQUIRE(pending->cancel());
    REQUIRE(exchange->was_aborted());
    REQUIRE(f.recorder.failures == 1);
    REQUIRE(f.recorder.error->code == ErrorCode::Cancelled);

    // The transport's own report of the abort arrives late and changes nothing.
    exchange->fail(TransportFault::aborted());
    REQUIRE(f.recorder.calls() == 1);
    REQUIRE(pending->state() == InvocationState::Cancelled);
    REQUIRE(pending->get().error().code == ErrorCode::Cancelled);
}

TEST_CASE("Cancel after headers ignores the rest of the exchange", "[bridge][cancel]") {
    Fixture f;
    auto connector = f.make_connector();

    auto pending = connector.apply(OutboundRequest("GET", "http://example.test/"), f.recorder.callback());
    auto exchange = f.transport->wait_for_exchange();
    exchange->headers(200);
    exchange->data("some");

    REQUIRE(pending->cancel());
    exchange->data("more");
    exchange->complete();

    REQUIRE(f.recorder.calls() == 1);
    REQUIRE(f.recorder.responses == 0);
    REQUIRE(pending->is_cancelled());
}

TEST_CASE("Cancel after completion changes nothing", "[bridge][cancel]") {
    Fixture f;
    auto connector = f.make_connector();

    auto pending = connector.apply(OutboundRequest("GET", "http://example.test/"), f.recorder.callback());
    auto exchange = f.transport->wait_for_exchange();
    exchange->respond(200, {}, {"done"});

    REQUIRE_FALSE(pending->cancel());
    REQUIRE_FALSE(exchange->was_aborted());
    REQUIRE(f.recorder.calls() == 1);
    REQUIRE(pending->get().value()->read_text().value() == "done");
}
