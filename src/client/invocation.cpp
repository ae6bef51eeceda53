#include "wirecall/client/invocation.hpp"
#include "wirecall/core/request_scope.hpp"
#include "wirecall/log/logger.hpp"

#include <format>

namespace wirecall {

EntityRule entity_rule_for(std::string_view verb) noexcept {
    if (verb == method::Get || verb == method::Head ||
        verb == method::Delete || verb == method::Trace) {
        return EntityRule::Forbidden;
    }
    if (verb == method::Put || verb == method::Patch) {
        return EntityRule::Required;
    }
    return EntityRule::Optional;
}

InvocationError make_status_error(ResponsePtr response, bool ignore_exception_response) {
    get_logger().debug_fmt("HTTP status error {} {}", response->status(), response->reason());
    if (ignore_exception_response) {
        auto status_only = std::make_shared<InboundResponse>(
            response->status(), response->reason(), HeaderMap{}, nullptr);
        response->close();
        return InvocationError::http_status_error(std::move(status_only));
    }

    // Release the connection now; the body stays readable from memory.
    auto buffered = response->buffer_entity();
    if (!buffered) {
        get_logger().warn_fmt("Could not buffer error response entity: {}", buffered.error().message);
    }
    return InvocationError::http_status_error(std::move(response));
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

InvocationDispatcher::InvocationDispatcher(std::shared_ptr<ITransport> transport, ClientConfig config)
    : connector_(std::make_shared<HttpConnector>(std::move(transport), std::move(config)))
{
    const auto& cfg = connector_->config();
    if (cfg.executor.has_value()) {
        executor_ = *cfg.executor;
        get_logger().debug("Async invocations use the configured executor");
        return;
    }

    const auto provider = select_executor_provider(cfg.executor_providers);
    if (provider.has_value()) {
        executor_ = provider->executor;
        get_logger().debug_fmt("Async invocations use executor provider '{}'", provider->name);
        return;
    }

    owned_pool_ = std::make_unique<asio::thread_pool>(cfg.async_threads);
    executor_ = owned_pool_->get_executor();
    get_logger().debug_fmt("Async invocations use an owned pool of {} threads", cfg.async_threads);
}

InvocationDispatcher::~InvocationDispatcher() {
    close();
}

void InvocationDispatcher::close() {
    connector_->close();
    if (owned_pool_ != nullptr) {
        owned_pool_->join();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

InvocationResult<void> InvocationDispatcher::validate(const OutboundRequest& request) const {
    const auto rule = entity_rule_for(request.method());
    const bool has_entity = request.has_entity();
    const bool forbidden_present = (rule == EntityRule::Forbidden) && has_entity;
    const bool required_missing = (rule == EntityRule::Required) && !has_entity;
    if (!forbidden_present && !required_missing) {
        return {};
    }

    auto suppress = request.properties().get_bool(property::SuppressHttpComplianceValidation);
    if (!suppress) {
        return tl::unexpected(suppress.error());
    }
    const bool suppressed =
        suppress->value_or(connector_->config().suppress_http_compliance_validation);

    const std::string message = forbidden_present
        ? std::format("Entity must be empty for HTTP method {}", request.method())
        : std::format("Entity must not be empty for HTTP method {}", request.method());

    if (suppressed) {
        get_logger().warn_fmt("{} (validation suppressed, sending anyway)", message);
        return {};
    }
    return tl::unexpected(InvocationError::invalid_state(message));
}

// ─────────────────────────────────────────────────────────────────────────────
// Synchronous
// ─────────────────────────────────────────────────────────────────────────────

InvocationResult<ResponsePtr> InvocationDispatcher::invoke(const OutboundRequest& request) {
    const OutboundRequest copy = request;
    auto valid = validate(copy);
    if (!valid) {
        return tl::unexpected(valid.error());
    }

    RequestScope scope(copy.method(), copy.uri());
    auto response = connector_->apply(copy);
    if (!response) {
        get_logger().debug_fmt("{} {} failed: {}", copy.method(), copy.uri(), response.error().message);
        return tl::unexpected(response.error());
    }
    if ((*response)->is_successful() == false) {
        return tl::unexpected(make_status_error(
            std::move(*response), connector_->config().ignore_exception_response));
    }
    return response;
}

// ─────────────────────────────────────────────────────────────────────────────
// Asynchronous
// ─────────────────────────────────────────────────────────────────────────────

void InvocationDispatcher::schedule(
    WireRequest wire,
    ResponseCallback callback,
    std::shared_ptr<PendingResponse> pending
) {
    asio::post(executor_,
        [connector = connector_, wire = std::move(wire), callback = std::move(callback),
         pending = std::move(pending)]() mutable {
            connector->dispatch(std::move(wire), std::move(callback), std::move(pending));
        });
}

}  // namespace wirecall
