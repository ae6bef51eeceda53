#ifndef WIRECALL_CLIENT_CLIENT_CONFIG_HPP
#define WIRECALL_CLIENT_CLIENT_CONFIG_HPP

#include "wirecall/client/executor_provider.hpp"
#include "wirecall/entity/entity_content_adapter.hpp"
#include "wirecall/entity/entity_stream.hpp"

#include <asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Client Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Connector-wide settings, checked once at construction. Requests can
// override timeouts, redirects, buffering and compliance validation through
// their property bag (see wirecall::property).

struct ClientConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Request Defaults
    // ─────────────────────────────────────────────────────────────────────────

    // Unset means the transport's own default. Zero or negative values are
    // ignored the same way.
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::chrono::milliseconds> read_timeout;

    bool follow_redirects{true};

    // Unset means the transport's default_entity_processing().
    std::optional<EntityProcessing> entity_processing;

    // ─────────────────────────────────────────────────────────────────────────
    // Response Handling
    // ─────────────────────────────────────────────────────────────────────────

    // Run once when a response entity stream is closed.
    ClosingStrategy closing_strategy;

    // Status errors carry only status and reason, no headers or entity.
    bool ignore_exception_response{false};

    // Cap on bytes buffered for one asynchronous response. Unset means
    // unbounded.
    std::optional<std::size_t> async_max_buffered_bytes;

    // ─────────────────────────────────────────────────────────────────────────
    // Validation
    // ─────────────────────────────────────────────────────────────────────────

    // Method/entity mismatches are logged instead of rejected.
    bool suppress_http_compliance_validation{false};

    // ─────────────────────────────────────────────────────────────────────────
    // Asynchronous Execution
    // ─────────────────────────────────────────────────────────────────────────
    // Explicit executor wins, then the best provider, then a pool owned by
    // the dispatcher with async_threads threads.

    std::optional<asio::any_io_executor> executor;
    std::vector<ExecutorProvider> executor_providers;
    std::size_t async_threads{4};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    ClientConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    ClientConfig& with_read_timeout(std::chrono::milliseconds timeout);
    ClientConfig& with_follow_redirects(bool follow);
    ClientConfig& with_entity_processing(EntityProcessing mode);
    ClientConfig& with_closing_strategy(ClosingStrategy strategy);
    ClientConfig& with_ignore_exception_response(bool ignore = true);
    ClientConfig& with_async_max_buffered_bytes(std::size_t bytes);
    ClientConfig& with_suppressed_compliance_validation(bool suppress = true);
    ClientConfig& with_executor(asio::any_io_executor exec);
    ClientConfig& with_executor_provider(ExecutorProvider provider);
    ClientConfig& with_async_threads(std::size_t count);

    /// Throws ConfigurationError for unusable executor settings or a zero
    /// buffer cap. Non-positive timeouts only draw a warning.
    void validate() const;

    /// connect_timeout when positive, otherwise unset.
    [[nodiscard]] std::optional<std::chrono::milliseconds> effective_connect_timeout() const noexcept;
    /// read_timeout when positive, otherwise unset.
    [[nodiscard]] std::optional<std::chrono::milliseconds> effective_read_timeout() const noexcept;
};

}  // namespace wirecall

#endif  // WIRECALL_CLIENT_CLIENT_CONFIG_HPP
