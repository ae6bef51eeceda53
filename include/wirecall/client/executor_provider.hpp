#pragma once

#include <asio/any_io_executor.hpp>

#include <optional>
#include <string>
#include <vector>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Executor Providers
// ─────────────────────────────────────────────────────────────────────────────
// Candidate executors for running asynchronous invocations, described by
// capability flags instead of being discovered.
//
// Score = 2 * is_async + 1 * !is_default, so an async provider always
// outranks a non-async one, and within the same async flag a non-default
// provider outranks a default one. Equal scores keep registration order.

struct ExecutorProvider {
    std::string name;
    asio::any_io_executor executor;
    bool is_default{false};
    bool is_async{false};

    [[nodiscard]] int priority_score() const noexcept {
        return (is_async ? 2 : 0) + (is_default ? 0 : 1);
    }
};

/// Highest-scoring provider, first registered among equals. nullopt when
/// the list is empty.
[[nodiscard]] std::optional<ExecutorProvider> select_executor_provider(
    const std::vector<ExecutorProvider>& providers
);

}  // namespace wirecall
