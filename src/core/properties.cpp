#include "wirecall/core/properties.hpp"

#include <format>

namespace wirecall {

std::string_view type_name(const PropertyValue& value) noexcept {
    switch (value.index()) {
        case 0:  return "bool";
        case 1:  return "int64";
        case 2:  return "string";
        default: return "unknown";
    }
}

PropertyBag& PropertyBag::set(std::string_view name, PropertyValue value) {
    values_.insert_or_assign(std::string(name), std::move(value));
    return *this;
}

bool PropertyBag::erase(std::string_view name) {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return false;
    }
    values_.erase(it);
    return true;
}

bool PropertyBag::contains(std::string_view name) const {
    return values_.find(name) != values_.end();
}

const PropertyValue* PropertyBag::find(std::string_view name) const {
    auto it = values_.find(name);
    return (it == values_.end()) ? nullptr : &it->second;
}

template <typename T>
InvocationResult<std::optional<T>> PropertyBag::get_as(
    std::string_view name,
    std::string_view expected
) const {
    const auto* value = find(name);
    if (value == nullptr) {
        return std::optional<T>{};
    }
    const auto* typed = std::get_if<T>(value);
    if (typed == nullptr) {
        return tl::unexpected(InvocationError::configuration(std::format(
            "Property '{}' must be {}, got {}", name, expected, type_name(*value)
        )));
    }
    return std::optional<T>{*typed};
}

InvocationResult<std::optional<bool>> PropertyBag::get_bool(std::string_view name) const {
    return get_as<bool>(name, "bool");
}

InvocationResult<std::optional<std::int64_t>> PropertyBag::get_int(std::string_view name) const {
    return get_as<std::int64_t>(name, "int64");
}

InvocationResult<std::optional<std::string>> PropertyBag::get_string(std::string_view name) const {
    return get_as<std::string>(name, "string");
}

}  // namespace wirecall
