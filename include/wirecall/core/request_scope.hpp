#pragma once

#include "wirecall/core/properties.hpp"

#include <cstdint>
#include <string>

namespace wirecall {

/// State visible to nested processing of one synchronous invocation.
struct RequestContext {
    std::uint64_t id{0};
    std::string method;
    std::string uri;
    PropertyBag attributes;
};

// ─────────────────────────────────────────────────────────────────────────────
// RequestScope
// ─────────────────────────────────────────────────────────────────────────────
// RAII scope binding a RequestContext to the current thread. Scopes nest:
// leaving one restores the enclosing context, whether the body returned or
// threw.

class RequestScope {
public:
    RequestScope(std::string method, std::string uri);
    ~RequestScope();

    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;
    RequestScope(RequestScope&&) = delete;
    RequestScope& operator=(RequestScope&&) = delete;

    [[nodiscard]] RequestContext& context() noexcept { return context_; }

    /// Innermost active context on this thread, nullptr outside any scope.
    [[nodiscard]] static RequestContext* current() noexcept;

private:
    RequestContext context_;
    RequestContext* previous_;
};

}  // namespace wirecall
