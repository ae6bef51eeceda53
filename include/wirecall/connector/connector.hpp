#pragma once

#include "wirecall/client/client_config.hpp"
#include "wirecall/connector/async_bridge.hpp"
#include "wirecall/connector/wire_request_translator.hpp"
#include "wirecall/core/message.hpp"
#include "wirecall/transport/transport.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// HttpConnector
// ─────────────────────────────────────────────────────────────────────────────
// Drives one transport for a client. apply() translates, sends and wraps
// the result; status codes are not interpreted here.

class HttpConnector {
public:
    /// Throws ConfigurationError when config does not validate or
    /// transport is null.
    HttpConnector(std::shared_ptr<ITransport> transport, ClientConfig config = {});
    ~HttpConnector();

    HttpConnector(const HttpConnector&) = delete;
    HttpConnector& operator=(const HttpConnector&) = delete;

    /// Blocking: the response entity is fully read into memory.
    [[nodiscard]] InvocationResult<ResponsePtr> apply(const OutboundRequest& request);

    /// Non-blocking: returns at once; callback and the pending response
    /// settle from the transport thread.
    std::shared_ptr<PendingResponse> apply(const OutboundRequest& request, ResponseCallback callback);

    /// Translation step of apply(), exposed so callers can fail fast on
    /// the calling thread and send later.
    [[nodiscard]] InvocationResult<WireRequest> prepare(const OutboundRequest& request) const;

    /// Send an already prepared request, settling pending and callback.
    void dispatch(
        WireRequest request,
        ResponseCallback callback,
        std::shared_ptr<PendingResponse> pending
    );

    /// Transport identity, e.g. "cpr 1.10.5".
    [[nodiscard]] std::string name() const;

    /// Closes the transport. Idempotent; later calls fail with a Closed
    /// transport fault.
    void close();

    [[nodiscard]] bool is_closed() const noexcept { return closed_.load(); }

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }
    [[nodiscard]] ITransport& transport() noexcept { return *transport_; }

private:
    std::shared_ptr<ITransport> transport_;
    ClientConfig config_;
    WireRequestTranslator translator_;
    std::atomic<bool> closed_{false};
};

}  // namespace wirecall
