#ifndef WIRECALL_TRANSPORT_TRANSPORT_CONFIG_HPP
#define WIRECALL_TRANSPORT_TRANSPORT_CONFIG_HPP

#include "wirecall/entity/entity_content_adapter.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Proxy / Credentials
// ─────────────────────────────────────────────────────────────────────────────

struct ProxyConfig {
    // Used for both http and https targets, e.g. "http://proxy.local:3128"
    std::string uri;
    std::optional<std::string> username;
    std::optional<std::string> password;
};

struct BasicCredentials {
    std::string username;
    std::string password;
};

// ─────────────────────────────────────────────────────────────────────────────
// Transport Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Everything the cpr transport needs, resolved once at construction.

struct TransportConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Timeouts
    // ─────────────────────────────────────────────────────────────────────────
    // Defaults for every exchange; requests may override them. Zero means
    // no limit.

    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds read_timeout{30'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Proxy and Authentication
    // ─────────────────────────────────────────────────────────────────────────

    std::optional<ProxyConfig> proxy;

    std::optional<BasicCredentials> credentials;

    // Send the Authorization header on the first attempt instead of waiting
    // for a 401 challenge. Streaming bodies cannot be replayed, so they are
    // always sent preemptively.
    bool preemptive_basic_auth{false};

    // ─────────────────────────────────────────────────────────────────────────
    // Behavior
    // ─────────────────────────────────────────────────────────────────────────

    // When false, cookies received on one exchange are sent on later ones.
    bool disable_cookies{false};

    // Threads running non-blocking exchanges.
    std::size_t worker_threads{4};

    // Cap on the body read by a blocking send. Exceeding it aborts the
    // exchange with ResponseTooLarge.
    std::optional<std::size_t> sync_response_max_size;

    std::string user_agent{"wirecall/1.0"};

    bool verify_tls{true};

    EntityProcessing default_entity_processing{EntityProcessing::Chunked};

    // Bytes a streaming request body may run ahead of the upload.
    std::size_t upload_pipe_capacity{64 * 1024};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    TransportConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    TransportConfig& with_read_timeout(std::chrono::milliseconds timeout);
    TransportConfig& with_proxy(
        std::string uri,
        std::optional<std::string> username = std::nullopt,
        std::optional<std::string> password = std::nullopt
    );
    TransportConfig& with_basic_auth(std::string username, std::string password, bool preemptive);
    TransportConfig& with_cookies_disabled(bool disabled = true);
    TransportConfig& with_worker_threads(std::size_t count);
    TransportConfig& with_sync_response_max_size(std::size_t bytes);
    TransportConfig& with_user_agent(std::string agent);
    TransportConfig& with_entity_processing(EntityProcessing mode);

    /// Throws ConfigurationError on negative timeouts, zero workers or an
    /// unparsable proxy URI.
    void validate() const;
};

}  // namespace wirecall

#endif  // WIRECALL_TRANSPORT_TRANSPORT_CONFIG_HPP
