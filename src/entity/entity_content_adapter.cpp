#include "wirecall/entity/entity_content_adapter.hpp"
#include "wirecall/core/http_types.hpp"
#include "wirecall/log/logger.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <stdexcept>

namespace wirecall {

std::optional<EntityProcessing> parse_entity_processing(std::string_view value) {
    const auto upper = to_upper_ascii(value);
    if (upper == "BUFFERED") {
        return EntityProcessing::Buffered;
    }
    if (upper == "CHUNKED") {
        return EntityProcessing::Chunked;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// StreamingBody
// ─────────────────────────────────────────────────────────────────────────────

StreamingBody::StreamingBody(Entity entity)
    : entity_(std::move(entity))
{}

tl::expected<void, std::string> StreamingBody::write(EntitySink& sink) const {
    try {
        entity_.write_to(sink);
    } catch (const std::exception& e) {
        return tl::unexpected(std::string(e.what()));
    } catch (...) {
        return tl::unexpected(std::string("entity writer threw a non-standard exception"));
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Strategy Selection
// ─────────────────────────────────────────────────────────────────────────────

InvocationResult<WireBody> adapt_entity(
    const std::optional<Entity>& entity,
    EntityProcessing mode
) {
    if (!entity.has_value()) {
        return WireBody{};
    }

    if (mode == EntityProcessing::Chunked) {
        return WireBody{StreamingBody(*entity)};
    }

    StreamingBody writer(*entity);
    StringSink sink;
    auto written = writer.write(sink);
    if (!written) {
        get_logger().debug_fmt("Buffered entity serialization failed: {}", written.error());
        return tl::unexpected(InvocationError::entity_write(
            std::format("Entity serialization failed: {}", written.error())
        ));
    }
    return WireBody{BufferedBody{sink.take(), entity->content_type()}};
}

// ─────────────────────────────────────────────────────────────────────────────
// BodyPipe
// ─────────────────────────────────────────────────────────────────────────────

BodyPipe::BodyPipe(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1))
    , sink_(*this)
{}

void BodyPipe::PipeSink::write(std::string_view bytes) {
    pipe_.push(bytes);
}

void BodyPipe::push(std::string_view bytes) {
    while (!bytes.empty()) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() {
            return aborted_ || (buffer_.size() - offset_) < capacity_;
        });
        if (aborted_) {
            throw std::runtime_error("request body upload aborted");
        }

        // Compact consumed bytes before appending.
        if (offset_ > 0) {
            buffer_.erase(0, offset_);
            offset_ = 0;
        }
        const std::size_t room = capacity_ - buffer_.size();
        const std::size_t n = std::min(room, bytes.size());
        buffer_.append(bytes.substr(0, n));
        bytes.remove_prefix(n);
        cv_.notify_all();
    }
}

void BodyPipe::pump(const StreamingBody& body) {
    auto written = body.write(sink_);
    if (written) {
        finish();
    } else {
        fail(written.error());
    }
}

void BodyPipe::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
    cv_.notify_all();
}

void BodyPipe::fail(std::string error) {
    std::lock_guard<std::mutex> lock(mutex_);
    // A writer unwinding because the consumer aborted is not a writer failure.
    if (aborted_) {
        finished_ = true;
        cv_.notify_all();
        return;
    }
    if (!error_.has_value()) {
        error_ = std::move(error);
    }
    finished_ = true;
    cv_.notify_all();
}

std::size_t BodyPipe::read(char* dest, std::size_t max) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() {
        return aborted_ || finished_ || buffer_.size() > offset_;
    });

    const std::size_t available = buffer_.size() - offset_;
    if (aborted_ || available == 0 || error_.has_value()) {
        return 0;
    }
    const std::size_t n = std::min(available, max);
    std::memcpy(dest, buffer_.data() + offset_, n);
    offset_ += n;
    cv_.notify_all();
    return n;
}

void BodyPipe::abort() {
    std::lock_guard<std::mutex> lock(mutex_);
    aborted_ = true;
    cv_.notify_all();
}

std::optional<std::string> BodyPipe::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

}  // namespace wirecall
