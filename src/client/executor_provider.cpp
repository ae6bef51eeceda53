#include "wirecall/client/executor_provider.hpp"

#include <algorithm>

namespace wirecall {

std::optional<ExecutorProvider> select_executor_provider(
    const std::vector<ExecutorProvider>& providers
) {
    if (providers.empty()) {
        return std::nullopt;
    }
    // max_element returns the first of several equal maxima.
    auto best = std::max_element(providers.begin(), providers.end(),
        [](const ExecutorProvider& a, const ExecutorProvider& b) {
            return a.priority_score() < b.priority_score();
        });
    return *best;
}

}  // namespace wirecall
