#include "wirecall/core/error.hpp"
#include "wirecall/core/message.hpp"

#include <format>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Status Kind Mapping
// ─────────────────────────────────────────────────────────────────────────────

std::string_view to_string(HttpStatusKind kind) noexcept {
    switch (kind) {
        case HttpStatusKind::BadRequest:          return "BadRequest";
        case HttpStatusKind::NotAuthorized:       return "NotAuthorized";
        case HttpStatusKind::Forbidden:           return "Forbidden";
        case HttpStatusKind::NotFound:            return "NotFound";
        case HttpStatusKind::NotAllowed:          return "NotAllowed";
        case HttpStatusKind::NotAcceptable:       return "NotAcceptable";
        case HttpStatusKind::NotSupported:        return "NotSupported";
        case HttpStatusKind::InternalServerError: return "InternalServerError";
        case HttpStatusKind::ServiceUnavailable:  return "ServiceUnavailable";
        case HttpStatusKind::Redirection:         return "Redirection";
        case HttpStatusKind::ClientError:         return "ClientError";
        case HttpStatusKind::ServerError:         return "ServerError";
        case HttpStatusKind::Generic:             return "Generic";
    }
    return "Generic";
}

std::optional<HttpStatusKind> status_kind_for_code(int status) noexcept {
    switch (status) {
        case 400: return HttpStatusKind::BadRequest;
        case 401: return HttpStatusKind::NotAuthorized;
        case 403: return HttpStatusKind::Forbidden;
        case 404: return HttpStatusKind::NotFound;
        case 405: return HttpStatusKind::NotAllowed;
        case 406: return HttpStatusKind::NotAcceptable;
        case 415: return HttpStatusKind::NotSupported;
        case 500: return HttpStatusKind::InternalServerError;
        case 503: return HttpStatusKind::ServiceUnavailable;
        default:  return std::nullopt;
    }
}

HttpStatusKind status_kind_for_family(StatusFamily family) noexcept {
    switch (family) {
        case StatusFamily::Redirection: return HttpStatusKind::Redirection;
        case StatusFamily::ClientError: return HttpStatusKind::ClientError;
        case StatusFamily::ServerError: return HttpStatusKind::ServerError;
        default:                        return HttpStatusKind::Generic;
    }
}

HttpStatusKind classify_status(int status) noexcept {
    const auto exact = status_kind_for_code(status);
    if (exact.has_value()) {
        return *exact;
    }
    return status_kind_for_family(family_of(status));
}

// ─────────────────────────────────────────────────────────────────────────────
// InvocationError Factories
// ─────────────────────────────────────────────────────────────────────────────

InvocationError InvocationError::configuration(std::string msg) {
    InvocationError err;
    err.code = ErrorCode::Configuration;
    err.message = std::move(msg);
    return err;
}

InvocationError InvocationError::entity_write(std::string msg) {
    InvocationError err;
    err.code = ErrorCode::EntityWrite;
    err.message = std::move(msg);
    return err;
}

InvocationError InvocationError::transport(TransportFault fault) {
    return transport(std::make_shared<const TransportFault>(std::move(fault)));
}

InvocationError InvocationError::transport(std::shared_ptr<const TransportFault> fault) {
    InvocationError err;
    // A failed entity writer surfaces as an entity error even when the
    // transport is the one that noticed it.
    const bool is_entity_failure =
        (fault != nullptr && fault->code == TransportFault::Code::EntityWrite);
    err.code = is_entity_failure ? ErrorCode::EntityWrite : ErrorCode::Transport;
    if (fault != nullptr) {
        err.message = std::format("{}: {}", to_string(fault->code), fault->message);
    } else {
        err.message = "Transport failure";
    }
    err.cause = std::move(fault);
    return err;
}

InvocationError InvocationError::invalid_state(std::string msg) {
    InvocationError err;
    err.code = ErrorCode::InvalidInvocationState;
    err.message = std::move(msg);
    return err;
}

InvocationError InvocationError::cancelled() {
    InvocationError err;
    err.code = ErrorCode::Cancelled;
    err.message = "Invocation cancelled";
    return err;
}

InvocationError InvocationError::http_status_error(std::shared_ptr<InboundResponse> response) {
    InvocationError err;
    err.code = ErrorCode::HttpStatus;
    if (response != nullptr) {
        const int status = response->status();
        err.http_status = status;
        err.family = family_of(status);
        err.status_kind = classify_status(status);
        err.message = std::format("HTTP {} {}", status, response->reason());
    } else {
        err.status_kind = HttpStatusKind::Generic;
        err.message = "HTTP status error without a response";
    }
    err.response = std::move(response);
    return err;
}

InvocationError InvocationError::response_processing(
    std::shared_ptr<InboundResponse> response,
    std::string msg
) {
    InvocationError err;
    err.code = ErrorCode::ResponseProcessing;
    err.message = std::move(msg);
    if (response != nullptr) {
        err.http_status = response->status();
        err.family = family_of(response->status());
    }
    err.response = std::move(response);
    return err;
}

}  // namespace wirecall
