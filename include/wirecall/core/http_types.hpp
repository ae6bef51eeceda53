#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Method Names
// ─────────────────────────────────────────────────────────────────────────────
// Methods travel as strings so callers can use extension methods; the
// well-known ones are spelled here once.

namespace method {
inline constexpr std::string_view Get     = "GET";
inline constexpr std::string_view Head    = "HEAD";
inline constexpr std::string_view Post    = "POST";
inline constexpr std::string_view Put     = "PUT";
inline constexpr std::string_view Patch   = "PATCH";
inline constexpr std::string_view Delete  = "DELETE";
inline constexpr std::string_view Options = "OPTIONS";
inline constexpr std::string_view Trace   = "TRACE";
}  // namespace method

namespace header {
inline constexpr std::string_view ContentLength   = "Content-Length";
inline constexpr std::string_view ContentType     = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view UserAgent       = "User-Agent";
}  // namespace header

/// ASCII uppercase copy ("get" -> "GET").
[[nodiscard]] std::string to_upper_ascii(std::string_view value);

/// Case-insensitive ASCII comparison (RFC 7230 header names).
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Header Fields
// ─────────────────────────────────────────────────────────────────────────────
// The flat, on-the-wire shape: one entry per field line, duplicates kept in
// arrival order.

using HeaderField = std::pair<std::string, std::string>;
using HeaderFields = std::vector<HeaderField>;

// ─────────────────────────────────────────────────────────────────────────────
// HeaderMap
// ─────────────────────────────────────────────────────────────────────────────
// Multi-valued header map. Names are matched case-insensitively and keep
// the spelling they were first added with. Names stay in first-insertion
// order and each name's values stay in insertion order. add() appends,
// it never overwrites.

class HeaderMap {
public:
    using Values = std::vector<std::string>;
    using Entry = std::pair<std::string, Values>;
    using const_iterator = std::vector<Entry>::const_iterator;

    HeaderMap() = default;
    HeaderMap(std::initializer_list<HeaderField> fields);

    /// Append a value under name.
    HeaderMap& add(std::string_view name, std::string value);

    /// Replace every value of name with a single value.
    HeaderMap& put(std::string_view name, std::string value);

    /// Drop name and all its values. Returns true when something was removed.
    bool remove(std::string_view name);

    [[nodiscard]] const Values* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::optional<std::string> first(std::string_view name) const;

    /// All values of name joined with sep, or nullopt if absent.
    [[nodiscard]] std::optional<std::string> joined(
        std::string_view name,
        std::string_view sep = ","
    ) const;

    /// Number of distinct names.
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    /// One field per value, names in map order.
    [[nodiscard]] HeaderFields to_fields() const;
    [[nodiscard]] static HeaderMap from_fields(const HeaderFields& fields);

    friend bool operator==(const HeaderMap&, const HeaderMap&) = default;

private:
    std::vector<Entry>::iterator locate(std::string_view name);
    std::vector<Entry>::const_iterator locate(std::string_view name) const;

    std::vector<Entry> entries_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Status Family
// ─────────────────────────────────────────────────────────────────────────────

enum class StatusFamily {
    Informational,  // 1xx
    Successful,     // 2xx
    Redirection,    // 3xx
    ClientError,    // 4xx
    ServerError,    // 5xx
    Other
};

[[nodiscard]] constexpr StatusFamily family_of(int status) noexcept {
    switch (status / 100) {
        case 1: return StatusFamily::Informational;
        case 2: return StatusFamily::Successful;
        case 3: return StatusFamily::Redirection;
        case 4: return StatusFamily::ClientError;
        case 5: return StatusFamily::ServerError;
        default: return StatusFamily::Other;
    }
}

[[nodiscard]] constexpr std::string_view to_string(StatusFamily family) noexcept {
    switch (family) {
        case StatusFamily::Informational: return "Informational";
        case StatusFamily::Successful:    return "Successful";
        case StatusFamily::Redirection:   return "Redirection";
        case StatusFamily::ClientError:   return "ClientError";
        case StatusFamily::ServerError:   return "ServerError";
        case StatusFamily::Other:         return "Other";
    }
    return "Other";
}

/// Standard reason phrase for a status code; empty when the code is not a
/// registered one.
[[nodiscard]] std::string_view standard_reason_phrase(int status) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────
// Parsed with ada-url (WHATWG). Only http and https are accepted.

struct UrlComponents {
    std::string scheme;
    std::string host;
    std::uint16_t port{0};
    std::string path;
    std::string query;
    std::string username;
    std::string password;

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string host_with_port() const {
        return host + ":" + std::to_string(port);
    }
};

[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace wirecall
