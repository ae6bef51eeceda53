#pragma once

#include "wirecall/client/pending_invocation.hpp"
#include "wirecall/core/message.hpp"
#include "wirecall/transport/transport.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace wirecall {

using ResponsePtr = std::shared_ptr<InboundResponse>;
using PendingResponse = PendingInvocation<ResponsePtr>;

/// Application callback of a non-blocking apply(). At most one of the two
/// is called, at most once.
struct ResponseCallback {
    std::function<void(ResponsePtr)> on_response;
    std::function<void(const InvocationError&)> on_failure;
};

// ─────────────────────────────────────────────────────────────────────────────
// AsyncBridge
// ─────────────────────────────────────────────────────────────────────────────
// Turns the event sequence of one exchange into a settled PendingResponse
// plus one application callback.
//
//   Headers   build the response around a queued entity stream
//   Data      append to the queue (never blocks)
//   Complete  end the queue, call back, complete the pending response
//   Failure   fail the queue, fail the pending response, call back
//
// The pending response settles at most once (its own CAS). The callback is
// guarded by a separate atomic flag: whoever claims it first (a terminal
// event, or a cancellation) is the only one that calls back. Cancelling
// aborts the exchange; events arriving afterwards change nothing.
//
// Both the callback and the pending response get copies of one
// InvocationError, so they share the same cause object.

class AsyncBridge final
    : public ITransportListener
    , public std::enable_shared_from_this<AsyncBridge> {
public:
    AsyncBridge(
        std::shared_ptr<PendingResponse> pending,
        ResponseCallback callback,
        ClosingStrategy closing_strategy,
        std::optional<std::size_t> max_buffered_bytes
    );

    /// Register with the transport and send. An exception thrown while
    /// registering is handled as a Failure event.
    void start(ITransport& transport, WireRequest request);

    void on_event(TransportEvent event) override;

    [[nodiscard]] const std::shared_ptr<PendingResponse>& pending() const noexcept { return pending_; }

private:
    void handle(HeadersEvent& event);
    void handle(DataEvent& event);
    void handle(CompleteEvent& event);
    void handle(FailureEvent& event);

    void fail_with(std::shared_ptr<const TransportFault> cause);
    void on_cancelled();
    void abort_exchange();

    /// True for the one caller that gets to run the application callback.
    [[nodiscard]] bool claim_callback() noexcept;

    void deliver_response(const ResponsePtr& response);
    void deliver_failure(const InvocationError& error);

    std::shared_ptr<PendingResponse> pending_;
    ResponseCallback callback_;
    ClosingStrategy closing_strategy_;
    std::optional<std::size_t> max_buffered_bytes_;

    std::atomic<bool> callback_claimed_{false};
    std::atomic<bool> terminated_{false};

    // Touched only from the transport's event thread.
    ResponsePtr response_;
    QueuedEntityStream* stream_{nullptr};

    std::mutex exchange_mutex_;
    std::shared_ptr<IExchange> exchange_;
    bool abort_requested_{false};
};

}  // namespace wirecall
