#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace wirecall {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// EntitySink
// ─────────────────────────────────────────────────────────────────────────────
// Where an outbound entity writes its bytes. Implementations may block
// (a transport pipe applying backpressure) and may throw to stop the writer.

class EntitySink {
public:
    virtual ~EntitySink() = default;
    virtual void write(std::string_view bytes) = 0;
};

/// Sink collecting everything into a string.
class StringSink final : public EntitySink {
public:
    void write(std::string_view bytes) override { buffer_.append(bytes); }

    [[nodiscard]] std::string& buffer() noexcept { return buffer_; }
    [[nodiscard]] std::string take() noexcept { return std::move(buffer_); }

private:
    std::string buffer_;
};

/// Produces an entity into a sink. Throwing reports a serialization failure.
using EntityWriter = std::function<void(EntitySink&)>;

// ─────────────────────────────────────────────────────────────────────────────
// Entity
// ─────────────────────────────────────────────────────────────────────────────
// An outbound request body: either bytes already in memory or a writer that
// produces them on demand. Writers may run more than once when a buffered
// body is replayed, so they must not consume one-shot state.

class Entity {
public:
    [[nodiscard]] static Entity bytes(
        std::string data,
        std::string content_type = "application/octet-stream"
    );

    [[nodiscard]] static Entity text(
        std::string data,
        std::string content_type = "text/plain; charset=utf-8"
    );

    /// Serialized lazily, so an unserializable document (invalid UTF-8)
    /// fails at write time like any other writer.
    [[nodiscard]] static Entity json(Json document);

    [[nodiscard]] static Entity streaming(
        EntityWriter writer,
        std::string content_type = "application/octet-stream",
        std::optional<std::size_t> length = std::nullopt
    );

    [[nodiscard]] const std::string& content_type() const noexcept { return content_type_; }

    /// Size when known up front (bytes entities, or declared by the writer).
    [[nodiscard]] std::optional<std::size_t> known_length() const noexcept { return length_; }

    /// True for writer-backed entities.
    [[nodiscard]] bool is_streaming() const noexcept { return static_cast<bool>(writer_); }

    /// Write the whole entity. Exceptions from a writer propagate.
    void write_to(EntitySink& sink) const;

private:
    Entity() = default;

    std::string content_type_;
    std::string data_;
    EntityWriter writer_;
    std::optional<std::size_t> length_;
};

}  // namespace wirecall
