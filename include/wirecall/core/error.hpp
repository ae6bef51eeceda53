#ifndef WIRECALL_CORE_ERROR_HPP
#define WIRECALL_CORE_ERROR_HPP

#include "wirecall/core/http_types.hpp"

#include <tl/expected.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wirecall {

class InboundResponse;

// ─────────────────────────────────────────────────────────────────────────────
// Transport Fault
// ─────────────────────────────────────────────────────────────────────────────
// What a transport reports when an exchange fails below HTTP semantics.
// Every transport maps its native failures onto these codes.

struct TransportFault {
    enum class Code {
        ConnectionFailed,   // refused, unreachable, DNS
        Timeout,            // connect or read timeout
        SslError,           // TLS handshake / verification
        Aborted,            // exchange aborted (cancellation, shutdown)
        ResponseTooLarge,   // body exceeded a configured cap
        EntityWrite,        // the streaming request entity failed to produce bytes
        Unsupported,        // method or feature the transport cannot express
        Closed,             // transport already closed
        Unknown
    };

    Code code{Code::Unknown};
    std::string message;

    static TransportFault connection_failed(std::string msg) {
        return {Code::ConnectionFailed, std::move(msg)};
    }
    static TransportFault timeout(std::string msg) {
        return {Code::Timeout, std::move(msg)};
    }
    static TransportFault ssl_error(std::string msg) {
        return {Code::SslError, std::move(msg)};
    }
    static TransportFault aborted(std::string msg = "Exchange aborted") {
        return {Code::Aborted, std::move(msg)};
    }
    static TransportFault response_too_large(std::string msg) {
        return {Code::ResponseTooLarge, std::move(msg)};
    }
    static TransportFault entity_write(std::string msg) {
        return {Code::EntityWrite, std::move(msg)};
    }
    static TransportFault unsupported(std::string msg) {
        return {Code::Unsupported, std::move(msg)};
    }
    static TransportFault closed() {
        return {Code::Closed, "Transport is closed"};
    }
    static TransportFault unknown(std::string msg) {
        return {Code::Unknown, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportFault::Code code) noexcept {
    switch (code) {
        case TransportFault::Code::ConnectionFailed: return "ConnectionFailed";
        case TransportFault::Code::Timeout:          return "Timeout";
        case TransportFault::Code::SslError:         return "SslError";
        case TransportFault::Code::Aborted:          return "Aborted";
        case TransportFault::Code::ResponseTooLarge: return "ResponseTooLarge";
        case TransportFault::Code::EntityWrite:      return "EntityWrite";
        case TransportFault::Code::Unsupported:      return "Unsupported";
        case TransportFault::Code::Closed:           return "Closed";
        case TransportFault::Code::Unknown:          return "Unknown";
    }
    return "Unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportFault>;

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Status Kinds
// ─────────────────────────────────────────────────────────────────────────────
// Exact-code kinds first, family fallbacks last. The two lookups are kept
// separate: a new exact code only touches status_kind_for_code().

enum class HttpStatusKind {
    BadRequest,           // 400
    NotAuthorized,        // 401
    Forbidden,            // 403
    NotFound,             // 404
    NotAllowed,           // 405
    NotAcceptable,        // 406
    NotSupported,         // 415
    InternalServerError,  // 500
    ServiceUnavailable,   // 503
    Redirection,          // other 3xx
    ClientError,          // other 4xx
    ServerError,          // other 5xx
    Generic               // anything else that is not 2xx
};

[[nodiscard]] std::string_view to_string(HttpStatusKind kind) noexcept;

/// Kind for the codes that have a dedicated variant, nullopt otherwise.
[[nodiscard]] std::optional<HttpStatusKind> status_kind_for_code(int status) noexcept;

[[nodiscard]] HttpStatusKind status_kind_for_family(StatusFamily family) noexcept;

/// Exact match first, then the family fallback.
[[nodiscard]] HttpStatusKind classify_status(int status) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Invocation Error
// ─────────────────────────────────────────────────────────────────────────────

enum class ErrorCode {
    Configuration,           // malformed or mistyped property
    EntityWrite,             // request entity serialization failed
    Transport,               // network / protocol failure
    HttpStatus,              // non-2xx response, see status_kind
    InvalidInvocationState,  // method/entity mismatch, caught before I/O
    Cancelled,               // the caller cancelled the invocation
    ResponseProcessing       // 2xx response whose entity could not be read
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Configuration:          return "Configuration";
        case ErrorCode::EntityWrite:            return "EntityWrite";
        case ErrorCode::Transport:              return "Transport";
        case ErrorCode::HttpStatus:             return "HttpStatus";
        case ErrorCode::InvalidInvocationState: return "InvalidInvocationState";
        case ErrorCode::Cancelled:              return "Cancelled";
        case ErrorCode::ResponseProcessing:     return "ResponseProcessing";
    }
    return "Unknown";
}

/// Error envelope for every failed invocation.
///
/// When http_status is set, family is always family_of(*http_status).
/// Copies share `response` and `cause`, so the failure callback and the
/// pending invocation of one asynchronous call observe the same objects.
struct InvocationError {
    ErrorCode code{ErrorCode::Transport};
    std::string message;
    std::optional<int> http_status;
    StatusFamily family{StatusFamily::Other};
    std::optional<HttpStatusKind> status_kind;
    std::shared_ptr<InboundResponse> response;
    std::shared_ptr<const TransportFault> cause;

    [[nodiscard]] bool is(HttpStatusKind kind) const noexcept {
        return status_kind.has_value() && *status_kind == kind;
    }

    [[nodiscard]] static InvocationError configuration(std::string msg);
    [[nodiscard]] static InvocationError entity_write(std::string msg);
    [[nodiscard]] static InvocationError transport(TransportFault fault);
    [[nodiscard]] static InvocationError transport(std::shared_ptr<const TransportFault> fault);
    [[nodiscard]] static InvocationError invalid_state(std::string msg);
    [[nodiscard]] static InvocationError cancelled();

    /// Status error for a response; status and family are taken from it.
    [[nodiscard]] static InvocationError http_status_error(std::shared_ptr<InboundResponse> response);

    [[nodiscard]] static InvocationError response_processing(
        std::shared_ptr<InboundResponse> response,
        std::string msg
    );
};

template <typename T>
using InvocationResult = tl::expected<T, InvocationError>;

// ─────────────────────────────────────────────────────────────────────────────
// ConfigurationError
// ─────────────────────────────────────────────────────────────────────────────
// Thrown from constructors and validate(); configuration problems are
// programming errors and fail fast, before any request exists.

class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace wirecall

#endif  // WIRECALL_CORE_ERROR_HPP
