#pragma once

#include "wirecall/client/client_config.hpp"
#include "wirecall/client/pending_invocation.hpp"
#include "wirecall/connector/connector.hpp"
#include "wirecall/entity/entity_reader.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Method / Entity Rules
// ─────────────────────────────────────────────────────────────────────────────

enum class EntityRule {
    Forbidden,  // GET, HEAD, DELETE, TRACE
    Required,   // PUT, PATCH
    Optional    // POST, OPTIONS and extension methods
};

[[nodiscard]] EntityRule entity_rule_for(std::string_view verb) noexcept;

template <typename T>
struct InvocationCallback {
    std::function<void(T)> on_completed;
    std::function<void(const InvocationError&)> on_failed;
};

/// Error for a non-2xx response. The entity is buffered and the source
/// stream closed first, or with ignore_exception_response the error gets a
/// status-only copy instead.
[[nodiscard]] InvocationError make_status_error(ResponsePtr response, bool ignore_exception_response);

// ─────────────────────────────────────────────────────────────────────────────
// InvocationDispatcher
// ─────────────────────────────────────────────────────────────────────────────
// Public entry point. Every call works on a private copy of the request and
// checks the method/entity table before any I/O.
//
// invoke() blocks on the calling thread inside a RequestScope. submit()
// returns immediately; sending happens on the selected executor and the
// result settles from the transport thread.
//
// Non-2xx statuses become HttpStatus errors before any conversion is tried.
// A 2xx whose entity cannot be converted is a ResponseProcessing error that
// still carries the response.

class InvocationDispatcher {
public:
    /// Throws ConfigurationError on invalid config.
    explicit InvocationDispatcher(std::shared_ptr<ITransport> transport, ClientConfig config = {});
    ~InvocationDispatcher();

    InvocationDispatcher(const InvocationDispatcher&) = delete;
    InvocationDispatcher& operator=(const InvocationDispatcher&) = delete;

    [[nodiscard]] InvocationResult<void> validate(const OutboundRequest& request) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Synchronous
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] InvocationResult<ResponsePtr> invoke(const OutboundRequest& request);

    template <typename T>
    [[nodiscard]] InvocationResult<T> invoke(const OutboundRequest& request) {
        auto response = invoke(request);
        if (!response) {
            return tl::unexpected(response.error());
        }
        return read_as<T>(*response);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Asynchronous
    // ─────────────────────────────────────────────────────────────────────────

    std::shared_ptr<PendingResponse> submit(const OutboundRequest& request) {
        return submit<ResponsePtr>(request, {});
    }

    template <typename T>
    std::shared_ptr<PendingInvocation<T>> submit(
        const OutboundRequest& request,
        InvocationCallback<T> callback = {}
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] HttpConnector& connector() noexcept { return *connector_; }

    /// Executor async sends are scheduled on.
    [[nodiscard]] const asio::any_io_executor& executor() const noexcept { return executor_; }

    [[nodiscard]] std::string name() const { return connector_->name(); }

    /// Closes the connector, then waits for the owned pool. Idempotent.
    void close();

private:
    template <typename T>
    static InvocationResult<T> read_as(const ResponsePtr& response) {
        if constexpr (std::is_same_v<T, ResponsePtr>) {
            return response;
        } else {
            auto value = read_entity<T>(*response);
            response->close();
            if (!value) {
                return tl::unexpected(InvocationError::response_processing(response, value.error()));
            }
            return std::move(*value);
        }
    }

    template <typename T>
    static InvocationResult<T> process(ResponsePtr response, bool ignore_exception_response) {
        if (response->is_successful() == false) {
            return tl::unexpected(make_status_error(std::move(response), ignore_exception_response));
        }
        return read_as<T>(response);
    }

    void schedule(WireRequest wire, ResponseCallback callback, std::shared_ptr<PendingResponse> pending);

    std::shared_ptr<HttpConnector> connector_;
    std::unique_ptr<asio::thread_pool> owned_pool_;
    asio::any_io_executor executor_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Template Implementation
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
std::shared_ptr<PendingInvocation<T>> InvocationDispatcher::submit(
    const OutboundRequest& request,
    InvocationCallback<T> callback
) {
    auto pending = std::make_shared<PendingInvocation<T>>();
    auto fail_now = [&pending, &callback](const InvocationError& error) {
        pending->try_fail(error);
        if (callback.on_failed) {
            callback.on_failed(error);
        }
        return pending;
    };

    const OutboundRequest copy = request;
    auto valid = validate(copy);
    if (!valid) {
        return fail_now(valid.error());
    }
    auto wire = connector_->prepare(copy);
    if (!wire) {
        return fail_now(wire.error());
    }

    auto raw = std::make_shared<PendingResponse>();
    pending->on_cancel([raw]() { raw->cancel(); });

    const bool ignore_exception_response = connector_->config().ignore_exception_response;
    ResponseCallback bridge_callback;
    bridge_callback.on_response = [pending, callback, ignore_exception_response](ResponsePtr response) {
        auto result = process<T>(std::move(response), ignore_exception_response);
        const bool settled = result ? pending->try_complete(*result) : pending->try_fail(result.error());
        if (settled == false) {
            // Cancelled while the response was being processed; the bridge
            // had already claimed its callback, so report the cancel here.
            if (pending->is_cancelled() && callback.on_failed) {
                callback.on_failed(InvocationError::cancelled());
            }
            return;
        }
        if (result && callback.on_completed) {
            callback.on_completed(std::move(*result));
        } else if (!result && callback.on_failed) {
            callback.on_failed(result.error());
        }
    };
    bridge_callback.on_failure = [pending, callback](const InvocationError& error) {
        // A cancellation has already settled pending; it is still reported
        // to the callback, once.
        const bool failed = pending->try_fail(error);
        const bool cancelled = (error.code == ErrorCode::Cancelled);
        if ((failed || cancelled) && callback.on_failed) {
            callback.on_failed(error);
        }
    };

    schedule(std::move(*wire), std::move(bridge_callback), std::move(raw));
    return pending;
}

}  // namespace wirecall
