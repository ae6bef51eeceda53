#pragma once

#include "wirecall/client/client_config.hpp"
#include "wirecall/core/message.hpp"
#include "wirecall/transport/transport.hpp"

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// WireRequestTranslator
// ─────────────────────────────────────────────────────────────────────────────
// OutboundRequest -> WireRequest for one transport. Does not send.
//
// A caller-supplied User-Agent replaces the transport's own agent header,
// so exactly one is sent either way. Timeout
// properties apply only when positive; other values are ignored with a
// warning. A property of the wrong type, an unknown buffering mode or an
// unusable target URI is a Configuration error.

class WireRequestTranslator {
public:
    WireRequestTranslator(const ITransport& transport, const ClientConfig& config);

    [[nodiscard]] InvocationResult<WireRequest> translate(const OutboundRequest& request) const;

    /// Buffering mode for request: property, then connector, then transport.
    [[nodiscard]] InvocationResult<EntityProcessing> entity_processing_for(
        const OutboundRequest& request
    ) const;

private:
    [[nodiscard]] InvocationResult<std::optional<std::chrono::milliseconds>> timeout_property(
        const OutboundRequest& request,
        std::string_view name,
        const std::optional<std::chrono::milliseconds>& fallback
    ) const;

    const ITransport& transport_;
    const ClientConfig& config_;
};

}  // namespace wirecall
