#include "wirecall/connector/response_assembler.hpp"

namespace wirecall {

std::string reason_or_standard(int status, const std::optional<std::string>& reason) {
    const bool has_reason = reason.has_value() && !reason->empty();
    if (has_reason) {
        return *reason;
    }
    return std::string(standard_reason_phrase(status));
}

std::shared_ptr<InboundResponse> assemble_response(
    WireResponse wire,
    ClosingStrategy closing_strategy
) {
    auto headers = HeaderMap::from_fields(wire.headers);
    const bool has_length = headers.contains(header::ContentLength);
    const bool chunked = headers.contains("Transfer-Encoding");
    if (!has_length && !chunked && !wire.body.empty()) {
        headers.add(header::ContentLength, std::to_string(wire.body.size()));
    }

    auto entity = std::make_unique<BufferedEntityStream>(std::move(wire.body));
    entity->set_closing_strategy(std::move(closing_strategy));

    auto response = std::make_shared<InboundResponse>(
        wire.status,
        reason_or_standard(wire.status, wire.reason),
        std::move(headers),
        std::move(entity)
    );
    if (wire.resolved_url.has_value()) {
        response->set_resolved_uri(std::move(*wire.resolved_url));
    }
    return response;
}

std::shared_ptr<InboundResponse> assemble_response(
    const HeadersEvent& headers,
    std::unique_ptr<EntityStream> entity,
    ClosingStrategy closing_strategy
) {
    entity->set_closing_strategy(std::move(closing_strategy));
    return std::make_shared<InboundResponse>(
        headers.status,
        reason_or_standard(headers.status, headers.reason),
        HeaderMap::from_fields(headers.headers),
        std::move(entity)
    );
}

}  // namespace wirecall
