#include "wirecall/client/client_config.hpp"
#include "wirecall/core/error.hpp"
#include "wirecall/log/logger.hpp"

namespace wirecall {

ClientConfig& ClientConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

ClientConfig& ClientConfig::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

ClientConfig& ClientConfig::with_follow_redirects(bool follow) {
    follow_redirects = follow;
    return *this;
}

ClientConfig& ClientConfig::with_entity_processing(EntityProcessing mode) {
    entity_processing = mode;
    return *this;
}

ClientConfig& ClientConfig::with_closing_strategy(ClosingStrategy strategy) {
    closing_strategy = std::move(strategy);
    return *this;
}

ClientConfig& ClientConfig::with_ignore_exception_response(bool ignore) {
    ignore_exception_response = ignore;
    return *this;
}

ClientConfig& ClientConfig::with_async_max_buffered_bytes(std::size_t bytes) {
    async_max_buffered_bytes = bytes;
    return *this;
}

ClientConfig& ClientConfig::with_suppressed_compliance_validation(bool suppress) {
    suppress_http_compliance_validation = suppress;
    return *this;
}

ClientConfig& ClientConfig::with_executor(asio::any_io_executor exec) {
    executor = std::move(exec);
    return *this;
}

ClientConfig& ClientConfig::with_executor_provider(ExecutorProvider provider) {
    executor_providers.push_back(std::move(provider));
    return *this;
}

ClientConfig& ClientConfig::with_async_threads(std::size_t count) {
    async_threads = count;
    return *this;
}

namespace {

std::optional<std::chrono::milliseconds> positive_or_unset(
    const std::optional<std::chrono::milliseconds>& timeout
) noexcept {
    if (timeout.has_value() && timeout->count() > 0) {
        return timeout;
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::chrono::milliseconds> ClientConfig::effective_connect_timeout() const noexcept {
    return positive_or_unset(connect_timeout);
}

std::optional<std::chrono::milliseconds> ClientConfig::effective_read_timeout() const noexcept {
    return positive_or_unset(read_timeout);
}

void ClientConfig::validate() const {
    if (connect_timeout.has_value() && connect_timeout->count() <= 0) {
        get_logger().warn_fmt("Ignoring non-positive connect timeout {}ms", connect_timeout->count());
    }
    if (read_timeout.has_value() && read_timeout->count() <= 0) {
        get_logger().warn_fmt("Ignoring non-positive read timeout {}ms", read_timeout->count());
    }
    if (async_max_buffered_bytes.has_value() && *async_max_buffered_bytes == 0) {
        throw ConfigurationError("ClientConfig: async_max_buffered_bytes must be positive when set");
    }
    if (executor.has_value() && !*executor) {
        throw ConfigurationError("ClientConfig: executor is set but empty");
    }
    for (const auto& provider : executor_providers) {
        if (!provider.executor) {
            throw ConfigurationError("ClientConfig: executor provider '" + provider.name + "' has no executor");
        }
    }
    const bool needs_own_pool = !executor.has_value() && executor_providers.empty();
    if (needs_own_pool && async_threads == 0) {
        throw ConfigurationError("ClientConfig: async_threads must be at least 1");
    }
}

}  // namespace wirecall
