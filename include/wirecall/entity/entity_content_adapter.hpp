#pragma once

#include "wirecall/core/error.hpp"
#include "wirecall/entity/entity.hpp"

#include <tl/expected.hpp>

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Entity Processing Mode
// ─────────────────────────────────────────────────────────────────────────────

enum class EntityProcessing {
    Buffered,  // serialized up front, replayable, sent with Content-Length
    Chunked    // drained by the transport while the request is in flight
};

[[nodiscard]] constexpr std::string_view to_string(EntityProcessing mode) noexcept {
    switch (mode) {
        case EntityProcessing::Buffered: return "BUFFERED";
        case EntityProcessing::Chunked:  return "CHUNKED";
    }
    return "BUFFERED";
}

/// Accepts "BUFFERED" / "CHUNKED" in any case.
[[nodiscard]] std::optional<EntityProcessing> parse_entity_processing(std::string_view value);

// ─────────────────────────────────────────────────────────────────────────────
// Wire Bodies
// ─────────────────────────────────────────────────────────────────────────────

struct BufferedBody {
    std::string bytes;
    std::string content_type;
};

/// A body the transport pulls while sending. Not replayable: a transport
/// must not resend it on an authentication challenge.
class StreamingBody {
public:
    explicit StreamingBody(Entity entity);

    [[nodiscard]] const std::string& content_type() const noexcept {
        return entity_.content_type();
    }

    [[nodiscard]] std::optional<std::size_t> known_length() const noexcept {
        return entity_.known_length();
    }

    /// Run the entity writer into sink. Writer exceptions become the error
    /// string; they never escape onto a transport thread.
    [[nodiscard]] tl::expected<void, std::string> write(EntitySink& sink) const;

private:
    Entity entity_;
};

using WireBody = std::variant<std::monostate, BufferedBody, StreamingBody>;

[[nodiscard]] inline bool has_body(const WireBody& body) noexcept {
    return std::holds_alternative<std::monostate>(body) == false;
}

/// Choose how the entity reaches the transport. Buffered mode serializes
/// here, so a failing writer is reported before any I/O.
[[nodiscard]] InvocationResult<WireBody> adapt_entity(
    const std::optional<Entity>& entity,
    EntityProcessing mode
);

// ─────────────────────────────────────────────────────────────────────────────
// BodyPipe
// ─────────────────────────────────────────────────────────────────────────────
// Bounded single-producer / single-consumer byte pipe between a streaming
// writer (producer thread) and a transport upload callback (consumer).
// The producer blocks while the pipe is full; abort() releases it.

class BodyPipe {
public:
    explicit BodyPipe(std::size_t capacity = 64 * 1024);

    BodyPipe(const BodyPipe&) = delete;
    BodyPipe& operator=(const BodyPipe&) = delete;

    /// Producer side. Writing after abort() throws std::runtime_error so
    /// the writer unwinds promptly.
    [[nodiscard]] EntitySink& sink() noexcept { return sink_; }

    /// Run body into the pipe and mark the end (or the failure).
    void pump(const StreamingBody& body);

    void finish();
    void fail(std::string error);

    /// Consumer side. Blocks until bytes, end or failure; 0 means no more
    /// bytes (check error() to tell end from failure).
    [[nodiscard]] std::size_t read(char* dest, std::size_t max);

    /// Consumer gave up (exchange aborted or finished early).
    void abort();

    [[nodiscard]] std::optional<std::string> error() const;

private:
    class PipeSink final : public EntitySink {
    public:
        explicit PipeSink(BodyPipe& pipe) : pipe_(pipe) {}
        void write(std::string_view bytes) override;
    private:
        BodyPipe& pipe_;
    };

    void push(std::string_view bytes);

    const std::size_t capacity_;
    PipeSink sink_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string buffer_;
    std::size_t offset_{0};
    bool finished_{false};
    bool aborted_{false};
    std::optional<std::string> error_;
};

}  // namespace wirecall
