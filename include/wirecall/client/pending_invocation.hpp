#pragma once

#include "wirecall/core/error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace wirecall {

enum class InvocationState {
    Pending,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(InvocationState state) noexcept {
    switch (state) {
        case InvocationState::Pending:   return "Pending";
        case InvocationState::Completed: return "Completed";
        case InvocationState::Failed:    return "Failed";
        case InvocationState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// PendingInvocation
// ─────────────────────────────────────────────────────────────────────────────
// Cancellable single-resolution result of an asynchronous invocation.
//
// The first of try_complete / try_fail / cancel wins via one atomic
// compare-and-swap on the state; every later attempt returns false and
// changes nothing. Shared between the caller and the I/O side through
// std::shared_ptr.

template <typename T>
class PendingInvocation {
public:
    PendingInvocation() = default;

    PendingInvocation(const PendingInvocation&) = delete;
    PendingInvocation& operator=(const PendingInvocation&) = delete;

    [[nodiscard]] InvocationState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_done() const noexcept {
        return state() != InvocationState::Pending;
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state() == InvocationState::Cancelled;
    }

    bool try_complete(T value) {
        if (claim(InvocationState::Completed) == false) {
            return false;
        }
        publish(std::move(value));
        return true;
    }

    bool try_fail(InvocationError error) {
        if (claim(InvocationState::Failed) == false) {
            return false;
        }
        publish(tl::unexpected(std::move(error)));
        return true;
    }

    /// Cancel if still pending and run the cancel hooks on this thread.
    bool cancel() {
        if (claim(InvocationState::Cancelled) == false) {
            return false;
        }
        publish(tl::unexpected(InvocationError::cancelled()));

        std::vector<std::function<void()>> hooks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hooks.swap(cancel_hooks_);
        }
        for (auto& hook : hooks) {
            hook();
        }
        return true;
    }

    /// Hook run when cancel() wins. Runs immediately if already cancelled.
    void on_cancel(std::function<void()> hook) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state() != InvocationState::Cancelled) {
                cancel_hooks_.push_back(std::move(hook));
                return;
            }
        }
        hook();
    }

    /// Block until settled. A cancelled invocation yields a Cancelled error.
    [[nodiscard]] InvocationResult<T> get() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return result_.has_value(); });
        return *result_;
    }

    /// nullopt on timeout.
    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<InvocationResult<T>> wait_for(
        std::chrono::duration<Rep, Period> timeout
    ) const {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool ready = cv_.wait_for(lock, timeout, [this]() { return result_.has_value(); });
        if (ready == false) {
            return std::nullopt;
        }
        return *result_;
    }

private:
    bool claim(InvocationState target) noexcept {
        auto expected = InvocationState::Pending;
        return state_.compare_exchange_strong(expected, target, std::memory_order_acq_rel);
    }

    void publish(InvocationResult<T> result) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result_ = std::move(result);
        }
        cv_.notify_all();
    }

    std::atomic<InvocationState> state_{InvocationState::Pending};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<InvocationResult<T>> result_;
    std::vector<std::function<void()>> cancel_hooks_;
};

}  // namespace wirecall
