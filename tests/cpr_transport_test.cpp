// ─────────────────────────────────────────────────────────────────────────────
// CprTransport Tests
// ─────────────────────────────────────────────────────────────────────────────
// No server is required: these cover configuration, refusal paths and a
// connection to a closed local port.

#include <catch2/catch_test_macros.hpp>

#include "wirecall/transport/cpr_transport.hpp"

#include <condition_variable>
#include <mutex>

using namespace wirecall;
using namespace std::chrono_literals;

namespace {

class RecordingListener final : public ITransportListener {
public:
    void on_event(TransportEvent event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
        cv_.notify_all();
    }

    bool wait_terminal(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return terminal() != nullptr; });
    }

    std::shared_ptr<const TransportFault> failure() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto* event = terminal();
        if (event == nullptr) {
            return nullptr;
        }
        const auto* failed = std::get_if<FailureEvent>(event);
        return failed ? failed->cause : nullptr;
    }

private:
    const TransportEvent* terminal() const {
        for (const auto& event : events_) {
            if (std::holds_alternative<CompleteEvent>(event) || std::holds_alternative<FailureEvent>(event)) {
                return &event;
            }
        }
        return nullptr;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<TransportEvent> events_;
};

WireRequest request_to(const CprTransport& transport, std::string method, std::string url) {
    auto request = transport.new_request(std::move(method), std::move(url));
    request.connect_timeout = 500ms;
    request.read_timeout = 500ms;
    return request;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TransportConfig defaults validate", "[cpr][config]") {
    TransportConfig config;
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.default_entity_processing == EntityProcessing::Chunked);
    REQUIRE(config.worker_threads == 4);
}

TEST_CASE("TransportConfig rejects bad values", "[cpr][config]") {
    SECTION("negative timeout") {
        TransportConfig config;
        config.with_connect_timeout(-1ms);
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }
    SECTION("no workers") {
        TransportConfig config;
        config.with_worker_threads(0);
        REQUIRE_THROWS_AS(CprTransport(config), ConfigurationError);
    }
    SECTION("bad proxy") {
        TransportConfig config;
        config.with_proxy("not a proxy");
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }
    SECTION("proxy password without user") {
        TransportConfig config;
        config.with_proxy("http://proxy.local:3128", std::nullopt, std::string("secret"));
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }
}

TEST_CASE("Transport identity and agent", "[cpr]") {
    CprTransport transport(TransportConfig{}.with_user_agent("inventory/0.1"));
    REQUIRE(transport.name().rfind("cpr ", 0) == 0);

    const auto request = transport.new_request("GET", "http://example.test/");
    REQUIRE(request.headers.size() == 1);
    REQUIRE(request.headers[0] == HeaderField{"User-Agent", "inventory/0.1"});
}

TEST_CASE("Cookie store follows the configuration", "[cpr]") {
    CprTransport with_cookies;
    REQUIRE(with_cookies.cookie_count() == 0);

    CprTransport without_cookies(TransportConfig{}.with_cookies_disabled());
    REQUIRE(without_cookies.cookie_count() == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Refusals
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TRACE is refused as unsupported", "[cpr]") {
    CprTransport transport;
    auto result = transport.send(request_to(transport, "TRACE", "http://127.0.0.1:1/"));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == TransportFault::Code::Unsupported);

    auto listener = std::make_shared<RecordingListener>();
    (void)transport.send_async(request_to(transport, "TRACE", "http://127.0.0.1:1/"), listener);
    REQUIRE(listener->failure()->code == TransportFault::Code::Unsupported);
}

TEST_CASE("A closed transport refuses new exchanges", "[cpr]") {
    CprTransport transport;
    transport.close();
    transport.close();

    auto result = transport.send(request_to(transport, "GET", "http://127.0.0.1:1/"));
    REQUIRE(result.error().code == TransportFault::Code::Closed);

    auto listener = std::make_shared<RecordingListener>();
    (void)transport.send_async(request_to(transport, "GET", "http://127.0.0.1:1/"), listener);
    REQUIRE(listener->failure()->code == TransportFault::Code::Closed);
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Refused connection maps to ConnectionFailed", "[cpr][network]") {
    CprTransport transport;
    auto result = transport.send(request_to(transport, "GET", "http://127.0.0.1:1/"));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == TransportFault::Code::ConnectionFailed);
}

TEST_CASE("Refused async connection ends with one Failure event", "[cpr][network]") {
    CprTransport transport;
    auto listener = std::make_shared<RecordingListener>();
    (void)transport.send_async(request_to(transport, "GET", "http://127.0.0.1:1/"), listener);

    REQUIRE(listener->wait_terminal(5s));
    REQUIRE(listener->failure()->code == TransportFault::Code::ConnectionFailed);
}
