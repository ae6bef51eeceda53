#pragma once

#include "wirecall/core/message.hpp"
#include "wirecall/entity/entity_stream.hpp"
#include "wirecall/transport/transport.hpp"

#include <memory>
#include <optional>
#include <string>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Response Assembly
// ─────────────────────────────────────────────────────────────────────────────
// Builds InboundResponse from what a transport produced. Header fields are
// accumulated in order, so a repeated name gets several values. A missing
// or empty reason phrase is replaced with the standard one for the status.

/// Reason as sent, or the standard phrase for status.
[[nodiscard]] std::string reason_or_standard(int status, const std::optional<std::string>& reason);

/// From a blocking send. The body is already in memory; Content-Length is
/// added when the transport did not report one.
[[nodiscard]] std::shared_ptr<InboundResponse> assemble_response(
    WireResponse wire,
    ClosingStrategy closing_strategy
);

/// Response shell for a non-blocking exchange; the body arrives later
/// through entity.
[[nodiscard]] std::shared_ptr<InboundResponse> assemble_response(
    const HeadersEvent& headers,
    std::unique_ptr<EntityStream> entity,
    ClosingStrategy closing_strategy
);

}  // namespace wirecall
