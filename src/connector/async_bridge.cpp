#include "wirecall/connector/async_bridge.hpp"
#include "wirecall/connector/response_assembler.hpp"
#include "wirecall/log/logger.hpp"

#include <variant>

namespace wirecall {

AsyncBridge::AsyncBridge(
    std::shared_ptr<PendingResponse> pending,
    ResponseCallback callback,
    ClosingStrategy closing_strategy,
    std::optional<std::size_t> max_buffered_bytes
)
    : pending_(std::move(pending))
    , callback_(std::move(callback))
    , closing_strategy_(std::move(closing_strategy))
    , max_buffered_bytes_(max_buffered_bytes)
{}

// ─────────────────────────────────────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────────────────────────────────────

void AsyncBridge::start(ITransport& transport, WireRequest request) {
    std::weak_ptr<AsyncBridge> weak = weak_from_this();
    pending_->on_cancel([weak]() {
        if (auto self = weak.lock()) {
            self->on_cancelled();
        }
    });
    if (pending_->is_cancelled()) {
        return;
    }

    std::shared_ptr<IExchange> exchange;
    try {
        exchange = transport.send_async(std::move(request), shared_from_this());
    } catch (const std::exception& e) {
        on_event(FailureEvent{std::make_shared<const TransportFault>(
            TransportFault::unknown(std::string("Registering exchange failed: ") + e.what()))});
        return;
    }

    bool abort_now = false;
    {
        std::lock_guard<std::mutex> lock(exchange_mutex_);
        exchange_ = exchange;
        abort_now = abort_requested_;
    }
    if (abort_now && exchange != nullptr) {
        exchange->abort();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Event Dispatch
// ─────────────────────────────────────────────────────────────────────────────

void AsyncBridge::on_event(TransportEvent event) {
    std::visit([this](auto& e) { handle(e); }, event);
}

void AsyncBridge::handle(HeadersEvent& event) {
    if (terminated_.load(std::memory_order_acquire)) {
        return;
    }
    if (pending_->is_done()) {
        // Settled from outside (cancelled) before the response existed:
        // nobody is waiting for this callback any more.
        (void)claim_callback();
        return;
    }

    auto stream = std::make_unique<QueuedEntityStream>(max_buffered_bytes_);
    stream_ = stream.get();

    // Closing the entity before the exchange ended releases the connection.
    std::weak_ptr<AsyncBridge> weak = weak_from_this();
    ClosingStrategy on_close = [weak, user = closing_strategy_](const StreamCloseInfo& info) {
        if (auto self = weak.lock()) {
            if (self->terminated_.load(std::memory_order_acquire) == false) {
                self->abort_exchange();
            }
        }
        if (user) {
            user(info);
        }
    };
    response_ = assemble_response(event, std::move(stream), std::move(on_close));
    get_logger().trace_fmt("Async response headers: {} {}", response_->status(), response_->reason());
}

void AsyncBridge::handle(DataEvent& event) {
    if (terminated_.load(std::memory_order_acquire) || stream_ == nullptr) {
        return;
    }
    const auto pushed = stream_->push(std::move(event.chunk));
    if (pushed != QueuedEntityStream::PushResult::Overflow) {
        return;
    }

    // The queue already failed itself; settle everything with its cause.
    if (terminated_.exchange(true)) {
        return;
    }
    auto cause = stream_->failure();
    get_logger().warn_fmt("Async response aborted: {}", cause->message);
    abort_exchange();
    const auto error = InvocationError::transport(cause);
    pending_->try_fail(error);
    if (claim_callback()) {
        deliver_failure(error);
    }
}

void AsyncBridge::handle(CompleteEvent& event) {
    if (terminated_.exchange(true)) {
        return;
    }
    if (response_ == nullptr) {
        const auto error = InvocationError::transport(TransportFault::unknown(
            "Exchange completed without response headers"));
        pending_->try_fail(error);
        if (claim_callback()) {
            deliver_failure(error);
        }
        return;
    }

    stream_->finish();
    if (event.resolved_url.has_value()) {
        response_->set_resolved_uri(std::move(*event.resolved_url));
    }
    if (claim_callback()) {
        deliver_response(response_);
    }
    pending_->try_complete(response_);
}

void AsyncBridge::handle(FailureEvent& event) {
    if (terminated_.exchange(true)) {
        return;
    }
    auto cause = event.cause ? std::move(event.cause)
                             : std::make_shared<const TransportFault>(TransportFault::unknown("Exchange failed"));
    if (stream_ != nullptr) {
        stream_->fail(cause);
    }

    const auto error = InvocationError::transport(std::move(cause));
    const bool failed_here = pending_->try_fail(error);
    if (failed_here) {
        get_logger().debug_fmt("Async invocation failed: {}", error.message);
    }
    if (claim_callback()) {
        deliver_failure(error);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Cancellation
// ─────────────────────────────────────────────────────────────────────────────

void AsyncBridge::on_cancelled() {
    get_logger().debug("Async invocation cancelled");
    // Claim first: an abort may synchronously deliver a Failure event.
    const bool claimed = claim_callback();
    abort_exchange();
    if (claimed) {
        deliver_failure(InvocationError::cancelled());
    }
}

void AsyncBridge::abort_exchange() {
    std::shared_ptr<IExchange> exchange;
    {
        std::lock_guard<std::mutex> lock(exchange_mutex_);
        abort_requested_ = true;
        exchange = exchange_;
    }
    if (exchange != nullptr) {
        exchange->abort();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Callback Delivery
// ─────────────────────────────────────────────────────────────────────────────

bool AsyncBridge::claim_callback() noexcept {
    bool expected = false;
    return callback_claimed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void AsyncBridge::deliver_response(const ResponsePtr& response) {
    if (!callback_.on_response) {
        return;
    }
    try {
        callback_.on_response(response);
    } catch (const std::exception& e) {
        get_logger().error_fmt("Response callback threw: {}", e.what());
    }
}

void AsyncBridge::deliver_failure(const InvocationError& error) {
    if (!callback_.on_failure) {
        return;
    }
    try {
        callback_.on_failure(error);
    } catch (const std::exception& e) {
        get_logger().error_fmt("Failure callback threw: {}", e.what());
    }
}

}  // namespace wirecall
