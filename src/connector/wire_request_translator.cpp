#include "wirecall/connector/wire_request_translator.hpp"
#include "wirecall/log/logger.hpp"

#include <algorithm>
#include <format>

namespace wirecall {

WireRequestTranslator::WireRequestTranslator(const ITransport& transport, const ClientConfig& config)
    : transport_(transport)
    , config_(config)
{}

InvocationResult<std::optional<std::chrono::milliseconds>> WireRequestTranslator::timeout_property(
    const OutboundRequest& request,
    std::string_view name,
    const std::optional<std::chrono::milliseconds>& fallback
) const {
    auto value = request.properties().get_int(name);
    if (!value) {
        return tl::unexpected(value.error());
    }
    if (!value->has_value()) {
        return fallback;
    }
    const std::int64_t ms = **value;
    if (ms <= 0) {
        get_logger().warn_fmt("Ignoring non-positive {} value {}", name, ms);
        return fallback;
    }
    return std::optional<std::chrono::milliseconds>{std::chrono::milliseconds{ms}};
}

InvocationResult<EntityProcessing> WireRequestTranslator::entity_processing_for(
    const OutboundRequest& request
) const {
    auto value = request.properties().get_string(property::EntityProcessing);
    if (!value) {
        return tl::unexpected(value.error());
    }
    if (value->has_value()) {
        const auto mode = parse_entity_processing(**value);
        if (!mode.has_value()) {
            return tl::unexpected(InvocationError::configuration(std::format(
                "Property '{}' must be BUFFERED or CHUNKED, got '{}'",
                property::EntityProcessing, **value
            )));
        }
        return *mode;
    }
    return config_.entity_processing.value_or(transport_.default_entity_processing());
}

InvocationResult<WireRequest> WireRequestTranslator::translate(const OutboundRequest& request) const {
    const bool uri_valid = parse_url(request.uri()).has_value();
    if (uri_valid == false) {
        return tl::unexpected(InvocationError::configuration(
            "Invalid target URI: " + request.uri()));
    }

    auto connect_timeout = timeout_property(request, property::ConnectTimeout, config_.effective_connect_timeout());
    if (!connect_timeout) {
        return tl::unexpected(connect_timeout.error());
    }
    auto read_timeout = timeout_property(request, property::ReadTimeout, config_.effective_read_timeout());
    if (!read_timeout) {
        return tl::unexpected(read_timeout.error());
    }
    auto follow = request.properties().get_bool(property::FollowRedirects);
    if (!follow) {
        return tl::unexpected(follow.error());
    }
    auto mode = entity_processing_for(request);
    if (!mode) {
        return tl::unexpected(mode.error());
    }

    auto body = adapt_entity(request.entity(), *mode);
    if (!body) {
        return tl::unexpected(body.error());
    }

    WireRequest wire = transport_.new_request(request.method(), request.uri());
    if (request.headers().contains(header::UserAgent)) {
        std::erase_if(wire.headers, [](const HeaderField& field) {
            return iequals(field.first, header::UserAgent);
        });
    }
    auto fields = request.headers().to_fields();
    wire.headers.insert(wire.headers.end(), fields.begin(), fields.end());

    const bool has_content_type = request.headers().contains(header::ContentType);
    if (request.has_entity() && !has_content_type && !request.entity()->content_type().empty()) {
        wire.headers.emplace_back(std::string(header::ContentType), request.entity()->content_type());
    }

    wire.body = std::move(*body);
    wire.connect_timeout = *connect_timeout;
    wire.read_timeout = *read_timeout;
    wire.follow_redirects = follow->value_or(config_.follow_redirects);
    return wire;
}

}  // namespace wirecall
