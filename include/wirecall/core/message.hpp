#pragma once

#include "wirecall/core/http_types.hpp"
#include "wirecall/core/properties.hpp"
#include "wirecall/entity/entity.hpp"
#include "wirecall/entity/entity_stream.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// OutboundRequest
// ─────────────────────────────────────────────────────────────────────────────
// Plain value type. The dispatcher copies it before doing anything, so a
// caller may keep mutating and reusing its own instance.

class OutboundRequest {
public:
    OutboundRequest(std::string method, std::string uri);

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const std::string& uri() const noexcept { return uri_; }

    [[nodiscard]] HeaderMap& headers() noexcept { return headers_; }
    [[nodiscard]] const HeaderMap& headers() const noexcept { return headers_; }

    [[nodiscard]] PropertyBag& properties() noexcept { return properties_; }
    [[nodiscard]] const PropertyBag& properties() const noexcept { return properties_; }

    [[nodiscard]] bool has_entity() const noexcept { return entity_.has_value(); }
    [[nodiscard]] const std::optional<Entity>& entity() const noexcept { return entity_; }

    OutboundRequest& header(std::string_view name, std::string value) {
        headers_.add(name, std::move(value));
        return *this;
    }

    OutboundRequest& property(std::string_view name, PropertyValue value) {
        properties_.set(name, std::move(value));
        return *this;
    }

    OutboundRequest& property(std::string_view name, const char* value) {
        properties_.set(name, value);
        return *this;
    }

    OutboundRequest& entity(Entity entity) {
        entity_ = std::move(entity);
        return *this;
    }

    OutboundRequest& clear_entity() noexcept {
        entity_.reset();
        return *this;
    }

private:
    std::string method_;
    std::string uri_;
    HeaderMap headers_;
    PropertyBag properties_;
    std::optional<Entity> entity_;
};

// ─────────────────────────────────────────────────────────────────────────────
// InboundResponse
// ─────────────────────────────────────────────────────────────────────────────
// Status line, headers and a once-consumable entity stream. Destroying the
// response closes the stream.

class InboundResponse {
public:
    InboundResponse(
        int status,
        std::string reason,
        HeaderMap headers,
        std::unique_ptr<EntityStream> entity
    );
    ~InboundResponse();

    InboundResponse(const InboundResponse&) = delete;
    InboundResponse& operator=(const InboundResponse&) = delete;

    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }
    [[nodiscard]] StatusFamily family() const noexcept { return family_of(status_); }
    [[nodiscard]] bool is_successful() const noexcept {
        return family() == StatusFamily::Successful;
    }

    [[nodiscard]] const HeaderMap& headers() const noexcept { return headers_; }

    /// Never null; a response without a body has an empty stream.
    [[nodiscard]] EntityStream& entity() noexcept { return *entity_; }

    /// Final URI when redirects were followed.
    [[nodiscard]] const std::optional<std::string>& resolved_uri() const noexcept {
        return resolved_uri_;
    }
    void set_resolved_uri(std::string uri) { resolved_uri_ = std::move(uri); }

    /// Read the remaining entity into memory and close the original stream,
    /// releasing its connection. Later reads come from memory. No-op when
    /// already buffered.
    [[nodiscard]] TransportResult<void> buffer_entity();

    [[nodiscard]] bool is_buffered() const noexcept { return buffered_; }

    /// Convenience: drain the whole entity as a string.
    [[nodiscard]] TransportResult<std::string> read_text();

    void close();

private:
    int status_;
    std::string reason_;
    HeaderMap headers_;
    std::unique_ptr<EntityStream> entity_;
    std::optional<std::string> resolved_uri_;
    bool buffered_{false};
};

}  // namespace wirecall
