#pragma once

#include "wirecall/transport/transport.hpp"
#include "wirecall/transport/transport_config.hpp"

#include <asio/thread_pool.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wirecall {

namespace detail {
class CookieStore;
class CprExchange;
}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// CprTransport
// ─────────────────────────────────────────────────────────────────────────────
// ITransport on cpr (libcurl). Blocking sends run on the caller's thread;
// non-blocking exchanges run on an asio::thread_pool and report progress
// through the listener from cpr's header/write callbacks.
//
// Response headers are parsed from the raw header lines, so repeated names
// are kept. Request header values sharing a name are folded into one
// comma-separated field, since cpr keys request headers by name.
//
// TRACE is not supported (cpr has no verb for it).

class CprTransport final : public ITransport {
public:
    /// Throws ConfigurationError if config does not validate.
    explicit CprTransport(TransportConfig config = {});
    ~CprTransport() override;

    CprTransport(const CprTransport&) = delete;
    CprTransport& operator=(const CprTransport&) = delete;

    [[nodiscard]] TransportResult<WireResponse> send(const WireRequest& request) override;

    [[nodiscard]] std::shared_ptr<IExchange> send_async(
        WireRequest request,
        std::shared_ptr<ITransportListener> listener
    ) override;

    [[nodiscard]] std::string user_agent() const override { return config_.user_agent; }

    [[nodiscard]] EntityProcessing default_entity_processing() const noexcept override {
        return config_.default_entity_processing;
    }

    /// "cpr <version>"
    [[nodiscard]] std::string name() const override;

    /// Aborts in-flight exchanges and joins the worker pool. Idempotent.
    void close() override;

    [[nodiscard]] const TransportConfig& config() const noexcept { return config_; }

    /// Cookies currently held in the shared store.
    [[nodiscard]] std::size_t cookie_count() const;

private:
    void run_async(
        const WireRequest& request,
        ITransportListener& listener,
        detail::CprExchange& exchange
    );

    void track(const std::shared_ptr<detail::CprExchange>& exchange);

    TransportConfig config_;
    std::unique_ptr<detail::CookieStore> cookies_;
    std::unique_ptr<asio::thread_pool> pool_;

    std::mutex exchanges_mutex_;
    std::vector<std::weak_ptr<detail::CprExchange>> exchanges_;
    std::atomic<bool> closed_{false};
};

}  // namespace wirecall
