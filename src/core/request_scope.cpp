#include "wirecall/core/request_scope.hpp"

#include <atomic>

namespace wirecall {

namespace {

thread_local RequestContext* t_current = nullptr;

std::uint64_t next_scope_id() {
    static std::atomic<std::uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

}  // namespace

RequestScope::RequestScope(std::string method, std::string uri)
    : previous_(t_current)
{
    context_.id = next_scope_id();
    context_.method = std::move(method);
    context_.uri = std::move(uri);
    t_current = &context_;
}

RequestScope::~RequestScope() {
    t_current = previous_;
}

RequestContext* RequestScope::current() noexcept {
    return t_current;
}

}  // namespace wirecall
