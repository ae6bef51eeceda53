#include "wirecall/transport/transport_config.hpp"
#include "wirecall/core/error.hpp"
#include "wirecall/core/http_types.hpp"

namespace wirecall {

TransportConfig& TransportConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

TransportConfig& TransportConfig::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

TransportConfig& TransportConfig::with_proxy(
    std::string uri,
    std::optional<std::string> username,
    std::optional<std::string> password
) {
    proxy = ProxyConfig{std::move(uri), std::move(username), std::move(password)};
    return *this;
}

TransportConfig& TransportConfig::with_basic_auth(
    std::string username,
    std::string password,
    bool preemptive
) {
    credentials = BasicCredentials{std::move(username), std::move(password)};
    preemptive_basic_auth = preemptive;
    return *this;
}

TransportConfig& TransportConfig::with_cookies_disabled(bool disabled) {
    disable_cookies = disabled;
    return *this;
}

TransportConfig& TransportConfig::with_worker_threads(std::size_t count) {
    worker_threads = count;
    return *this;
}

TransportConfig& TransportConfig::with_sync_response_max_size(std::size_t bytes) {
    sync_response_max_size = bytes;
    return *this;
}

TransportConfig& TransportConfig::with_user_agent(std::string agent) {
    user_agent = std::move(agent);
    return *this;
}

TransportConfig& TransportConfig::with_entity_processing(EntityProcessing mode) {
    default_entity_processing = mode;
    return *this;
}

void TransportConfig::validate() const {
    if (connect_timeout.count() < 0 || read_timeout.count() < 0) {
        throw ConfigurationError("TransportConfig: timeouts must not be negative");
    }
    if (worker_threads == 0) {
        throw ConfigurationError("TransportConfig: worker_threads must be at least 1");
    }
    if (upload_pipe_capacity == 0) {
        throw ConfigurationError("TransportConfig: upload_pipe_capacity must be at least 1");
    }
    if (proxy.has_value()) {
        const bool proxy_valid = parse_url(proxy->uri).has_value();
        if (proxy_valid == false) {
            throw ConfigurationError("TransportConfig: invalid proxy uri: " + proxy->uri);
        }
        if (proxy->password.has_value() && !proxy->username.has_value()) {
            throw ConfigurationError("TransportConfig: proxy password given without username");
        }
    }
}

}  // namespace wirecall
