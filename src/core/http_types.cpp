#include "wirecall/core/http_types.hpp"

#include <ada.h>

#include <algorithm>
#include <cctype>
#include <ranges>

namespace wirecall {

std::string to_upper_ascii(std::string_view value) {
    std::string result(value);
    std::ranges::transform(result, result.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// ─────────────────────────────────────────────────────────────────────────────
// HeaderMap
// ─────────────────────────────────────────────────────────────────────────────

HeaderMap::HeaderMap(std::initializer_list<HeaderField> fields) {
    for (const auto& [name, value] : fields) {
        add(name, value);
    }
}

std::vector<HeaderMap::Entry>::iterator HeaderMap::locate(std::string_view name) {
    return std::ranges::find_if(entries_,
        [name](const Entry& entry) { return iequals(entry.first, name); });
}

std::vector<HeaderMap::Entry>::const_iterator HeaderMap::locate(std::string_view name) const {
    return std::ranges::find_if(entries_,
        [name](const Entry& entry) { return iequals(entry.first, name); });
}

HeaderMap& HeaderMap::add(std::string_view name, std::string value) {
    auto it = locate(name);
    if (it == entries_.end()) {
        entries_.emplace_back(std::string(name), Values{std::move(value)});
    } else {
        it->second.push_back(std::move(value));
    }
    return *this;
}

HeaderMap& HeaderMap::put(std::string_view name, std::string value) {
    auto it = locate(name);
    if (it == entries_.end()) {
        entries_.emplace_back(std::string(name), Values{std::move(value)});
    } else {
        it->second.assign(1, std::move(value));
    }
    return *this;
}

bool HeaderMap::remove(std::string_view name) {
    auto it = locate(name);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

const HeaderMap::Values* HeaderMap::find(std::string_view name) const {
    auto it = locate(name);
    return (it == entries_.end()) ? nullptr : &it->second;
}

bool HeaderMap::contains(std::string_view name) const {
    return find(name) != nullptr;
}

std::optional<std::string> HeaderMap::first(std::string_view name) const {
    const auto* values = find(name);
    if (values == nullptr || values->empty()) {
        return std::nullopt;
    }
    return values->front();
}

std::optional<std::string> HeaderMap::joined(std::string_view name, std::string_view sep) const {
    const auto* values = find(name);
    if (values == nullptr) {
        return std::nullopt;
    }
    std::string result;
    for (std::size_t i = 0; i < values->size(); ++i) {
        if (i > 0) {
            result += sep;
        }
        result += (*values)[i];
    }
    return result;
}

HeaderFields HeaderMap::to_fields() const {
    HeaderFields fields;
    for (const auto& [name, values] : entries_) {
        for (const auto& value : values) {
            fields.emplace_back(name, value);
        }
    }
    return fields;
}

HeaderMap HeaderMap::from_fields(const HeaderFields& fields) {
    HeaderMap map;
    for (const auto& [name, value] : fields) {
        map.add(name, value);
    }
    return map;
}

// ─────────────────────────────────────────────────────────────────────────────
// Reason Phrases
// ─────────────────────────────────────────────────────────────────────────────

std::string_view standard_reason_phrase(int status) noexcept {
    switch (status) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "Non-Authoritative Information";
        case 204: return "No Content";
        case 205: return "Reset Content";
        case 206: return "Partial Content";
        case 300: return "Multiple Choices";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 305: return "Use Proxy";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 407: return "Proxy Authentication Required";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 412: return "Precondition Failed";
        case 413: return "Request Entity Too Large";
        case 414: return "Request-URI Too Long";
        case 415: return "Unsupported Media Type";
        case 416: return "Requested Range Not Satisfiable";
        case 417: return "Expectation Failed";
        case 428: return "Precondition Required";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 451: return "Unavailable For Legal Reasons";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        case 511: return "Network Authentication Required";
        default:  return {};
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Parsing (ada-url)
// ─────────────────────────────────────────────────────────────────────────────

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return std::nullopt;
    }
    const auto& ada_url = parsed.value();

    // ada reports "https:" with the trailing colon
    std::string scheme(ada_url.get_protocol());
    if (!scheme.empty() && scheme.back() == ':') {
        scheme.pop_back();
    }
    const bool is_https = (scheme == "https");
    if (scheme != "http" && !is_https) {
        return std::nullopt;
    }

    std::string host(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    UrlComponents result;
    const auto port_str = ada_url.get_port();
    if (port_str.empty()) {
        result.port = is_https ? 443 : 80;
    } else {
        result.port = static_cast<std::uint16_t>(std::stoi(std::string(port_str)));
    }

    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.path = std::string(ada_url.get_pathname());
    if (result.path.empty()) {
        result.path = "/";
    }
    result.query = std::string(ada_url.get_search());
    result.username = std::string(ada_url.get_username());
    result.password = std::string(ada_url.get_password());
    return result;
}

}  // namespace wirecall
