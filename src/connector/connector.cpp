#include "wirecall/connector/connector.hpp"
#include "wirecall/connector/response_assembler.hpp"
#include "wirecall/log/logger.hpp"

namespace wirecall {

namespace {

std::shared_ptr<ITransport> require_transport(std::shared_ptr<ITransport> transport) {
    if (transport == nullptr) {
        throw ConfigurationError("HttpConnector: transport cannot be null");
    }
    return transport;
}

}  // namespace

HttpConnector::HttpConnector(std::shared_ptr<ITransport> transport, ClientConfig config)
    : transport_(require_transport(std::move(transport)))
    , config_(std::move(config))
    , translator_(*transport_, config_)
{
    config_.validate();
    get_logger().info_fmt("HttpConnector using {}", transport_->name());
}

HttpConnector::~HttpConnector() {
    close();
}

std::string HttpConnector::name() const {
    return transport_->name();
}

void HttpConnector::close() {
    const bool already_closed = closed_.exchange(true);
    if (already_closed) {
        return;
    }
    transport_->close();
    get_logger().info("HttpConnector closed");
}

InvocationResult<WireRequest> HttpConnector::prepare(const OutboundRequest& request) const {
    return translator_.translate(request);
}

// ─────────────────────────────────────────────────────────────────────────────
// Blocking
// ─────────────────────────────────────────────────────────────────────────────

InvocationResult<ResponsePtr> HttpConnector::apply(const OutboundRequest& request) {
    if (closed_.load()) {
        return tl::unexpected(InvocationError::transport(TransportFault::closed()));
    }

    auto wire = prepare(request);
    if (!wire) {
        return tl::unexpected(wire.error());
    }

    auto sent = transport_->send(*wire);
    if (!sent) {
        get_logger().debug_fmt("{} {} failed: {}", request.method(), request.uri(), sent.error().message);
        return tl::unexpected(InvocationError::transport(std::move(sent.error())));
    }
    return assemble_response(std::move(*sent), config_.closing_strategy);
}

// ─────────────────────────────────────────────────────────────────────────────
// Non-blocking
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<PendingResponse> HttpConnector::apply(
    const OutboundRequest& request,
    ResponseCallback callback
) {
    auto pending = std::make_shared<PendingResponse>();
    auto wire = prepare(request);
    if (!wire) {
        pending->try_fail(wire.error());
        if (callback.on_failure) {
            callback.on_failure(wire.error());
        }
        return pending;
    }
    dispatch(std::move(*wire), std::move(callback), pending);
    return pending;
}

void HttpConnector::dispatch(
    WireRequest request,
    ResponseCallback callback,
    std::shared_ptr<PendingResponse> pending
) {
    auto bridge = std::make_shared<AsyncBridge>(
        std::move(pending),
        std::move(callback),
        config_.closing_strategy,
        config_.async_max_buffered_bytes
    );
    if (closed_.load()) {
        bridge->on_event(FailureEvent{std::make_shared<const TransportFault>(TransportFault::closed())});
        return;
    }
    bridge->start(*transport_, std::move(request));
}

}  // namespace wirecall
