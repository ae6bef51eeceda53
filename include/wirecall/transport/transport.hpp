#pragma once

#include "wirecall/core/error.hpp"
#include "wirecall/core/http_types.hpp"
#include "wirecall/entity/entity_content_adapter.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Wire Request / Response
// ─────────────────────────────────────────────────────────────────────────────
// What actually goes to a transport: flat header fields, a prepared body and
// the per-call knobs. Built by WireRequestTranslator.

struct WireRequest {
    std::string method;
    std::string url;
    HeaderFields headers;
    WireBody body;
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::chrono::milliseconds> read_timeout;
    bool follow_redirects{true};
};

/// Result of a blocking send; the body is fully read.
struct WireResponse {
    int status{0};
    std::optional<std::string> reason;
    HeaderFields headers;
    std::string body;
    std::optional<std::string> resolved_url;
};

// ─────────────────────────────────────────────────────────────────────────────
// Transport Events
// ─────────────────────────────────────────────────────────────────────────────
// Per exchange the order is Headers, Data*, then exactly one of Complete or
// Failure. A Failure may also arrive without Headers (connect refused).

struct HeadersEvent {
    int status{0};
    std::optional<std::string> reason;
    HeaderFields headers;
};

struct DataEvent {
    std::string chunk;
};

/// The final URL is only known once the exchange ends.
struct CompleteEvent {
    std::optional<std::string> resolved_url;
};

struct FailureEvent {
    std::shared_ptr<const TransportFault> cause;
};

using TransportEvent = std::variant<HeadersEvent, DataEvent, CompleteEvent, FailureEvent>;

class ITransportListener {
public:
    virtual ~ITransportListener() = default;

    /// Called on a transport thread, never concurrently for one exchange.
    virtual void on_event(TransportEvent event) = 0;
};

/// Handle to an in-flight non-blocking exchange.
class IExchange {
public:
    virtual ~IExchange() = default;

    /// Best effort. The listener still receives a terminal event unless one
    /// was already delivered.
    virtual void abort() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ITransport Interface
// ─────────────────────────────────────────────────────────────────────────────
// The HTTP execution engine the connector drives. Implementations own
// connection pooling, TLS, proxies and cookies, and must be safe for
// concurrent send() / send_async() calls.

class ITransport {
public:
    virtual ~ITransport() = default;

    /// Blocking exchange on the calling thread.
    [[nodiscard]] virtual TransportResult<WireResponse> send(const WireRequest& request) = 0;

    /// Start a non-blocking exchange; events go to listener. May throw if
    /// the exchange cannot even be registered.
    [[nodiscard]] virtual std::shared_ptr<IExchange> send_async(
        WireRequest request,
        std::shared_ptr<ITransportListener> listener
    ) = 0;

    /// A request pre-populated with whatever the transport adds on its own
    /// (its agent header).
    [[nodiscard]] virtual WireRequest new_request(std::string method, std::string url) const {
        WireRequest request;
        request.method = std::move(method);
        request.url = std::move(url);
        request.headers.emplace_back(std::string(header::UserAgent), user_agent());
        return request;
    }

    [[nodiscard]] virtual std::string user_agent() const { return "wirecall"; }

    /// Buffering mode used when neither the connector nor the request
    /// chooses one.
    [[nodiscard]] virtual EntityProcessing default_entity_processing() const noexcept = 0;

    [[nodiscard]] virtual std::string name() const = 0;

    virtual void close() = 0;
};

}  // namespace wirecall
