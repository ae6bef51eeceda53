#pragma once

#include "wirecall/core/error.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Property Names
// ─────────────────────────────────────────────────────────────────────────────
// Per-request overrides understood by the connector.

namespace property {
inline constexpr std::string_view ConnectTimeout = "wirecall.connect_timeout_ms";   // int64 ms
inline constexpr std::string_view ReadTimeout    = "wirecall.read_timeout_ms";      // int64 ms
inline constexpr std::string_view FollowRedirects = "wirecall.follow_redirects";    // bool
inline constexpr std::string_view EntityProcessing = "wirecall.entity_processing";  // "BUFFERED" | "CHUNKED"
inline constexpr std::string_view SuppressHttpComplianceValidation =
    "wirecall.suppress_http_compliance_validation";                                 // bool
}  // namespace property

using PropertyValue = std::variant<bool, std::int64_t, std::string>;

[[nodiscard]] std::string_view type_name(const PropertyValue& value) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// PropertyBag
// ─────────────────────────────────────────────────────────────────────────────
// Untyped storage, typed reads. A present value of the wrong alternative is
// a Configuration error; an absent value is nullopt.

class PropertyBag {
public:
    PropertyBag& set(std::string_view name, PropertyValue value);

    // Keeps string literals from decaying to bool.
    PropertyBag& set(std::string_view name, const char* value) {
        return set(name, PropertyValue{std::string(value)});
    }

    bool erase(std::string_view name);

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] const PropertyValue* find(std::string_view name) const;
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    [[nodiscard]] InvocationResult<std::optional<bool>> get_bool(std::string_view name) const;
    [[nodiscard]] InvocationResult<std::optional<std::int64_t>> get_int(std::string_view name) const;
    [[nodiscard]] InvocationResult<std::optional<std::string>> get_string(std::string_view name) const;

private:
    template <typename T>
    InvocationResult<std::optional<T>> get_as(std::string_view name, std::string_view expected) const;

    std::map<std::string, PropertyValue, std::less<>> values_;
};

}  // namespace wirecall
