#include "wirecall/entity/entity_stream.hpp"
#include "wirecall/log/logger.hpp"

#include <algorithm>
#include <cstring>
#include <format>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// EntityStream
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::size_t> EntityStream::read(char* dest, std::size_t max) {
    if (is_closed()) {
        return tl::unexpected(TransportFault::closed());
    }
    auto result = do_read(dest, max);
    if (result && *result == 0 && max > 0) {
        consumed_.store(true, std::memory_order_release);
    }
    return result;
}

TransportResult<std::string> EntityStream::read_all() {
    std::string result;
    char buffer[8192];
    while (true) {
        auto n = read(buffer, sizeof(buffer));
        if (!n) {
            return tl::unexpected(n.error());
        }
        if (*n == 0) {
            break;
        }
        result.append(buffer, *n);
    }
    return result;
}

void EntityStream::close() {
    bool expected = false;
    const bool first_close = closed_.compare_exchange_strong(
        expected, true, std::memory_order_acq_rel);
    if (first_close == false) {
        return;
    }

    do_close();

    if (!closing_strategy_) {
        return;
    }
    const StreamCloseInfo info{fully_consumed(), has_failed()};
    try {
        closing_strategy_(info);
    } catch (const std::exception& e) {
        get_logger().error_fmt("Closing strategy failed: {}", e.what());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// BufferedEntityStream
// ─────────────────────────────────────────────────────────────────────────────

BufferedEntityStream::BufferedEntityStream(std::string data)
    : data_(std::move(data))
{}

TransportResult<std::size_t> BufferedEntityStream::do_read(char* dest, std::size_t max) {
    const std::size_t n = std::min(max, data_.size() - position_);
    if (n > 0) {
        std::memcpy(dest, data_.data() + position_, n);
        position_ += n;
    }
    return n;
}

void BufferedEntityStream::do_close() {
    // Memory only; nothing to release.
}

// ─────────────────────────────────────────────────────────────────────────────
// QueuedEntityStream
// ─────────────────────────────────────────────────────────────────────────────

QueuedEntityStream::QueuedEntityStream(std::optional<std::size_t> max_buffered_bytes)
    : max_buffered_bytes_(max_buffered_bytes)
{}

QueuedEntityStream::PushResult QueuedEntityStream::push(std::string chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool ended = finished_ || reader_closed_ || (failure_ != nullptr);
    if (ended) {
        return PushResult::Discarded;
    }
    if (chunk.empty()) {
        return PushResult::Accepted;
    }

    const std::size_t next_size = buffered_ + chunk.size();
    const bool over_cap = max_buffered_bytes_.has_value() && next_size > *max_buffered_bytes_;
    if (over_cap) {
        failure_ = std::make_shared<const TransportFault>(TransportFault::response_too_large(
            std::format("Response buffer limit of {} bytes exceeded", *max_buffered_bytes_)
        ));
        cv_.notify_all();
        return PushResult::Overflow;
    }

    buffered_ = next_size;
    chunks_.push_back(std::move(chunk));
    cv_.notify_all();
    return PushResult::Accepted;
}

void QueuedEntityStream::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
    cv_.notify_all();
}

void QueuedEntityStream::fail(std::shared_ptr<const TransportFault> cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_ || failure_ != nullptr) {
        return;
    }
    failure_ = cause ? std::move(cause)
                     : std::make_shared<const TransportFault>(TransportFault::unknown("Stream failed"));
    cv_.notify_all();
}

std::shared_ptr<const TransportFault> QueuedEntityStream::failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

std::size_t QueuedEntityStream::buffered_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffered_;
}

bool QueuedEntityStream::has_failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_ != nullptr;
}

TransportResult<std::size_t> QueuedEntityStream::do_read(char* dest, std::size_t max) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() {
        return !chunks_.empty() || finished_ || reader_closed_ || failure_ != nullptr;
    });

    if (reader_closed_) {
        return tl::unexpected(TransportFault::closed());
    }

    // Bytes that arrived before a failure are still delivered; the failure
    // surfaces once they are drained.
    std::size_t copied = 0;
    while (copied < max && !chunks_.empty()) {
        auto& front = chunks_.front();
        const std::size_t n = std::min(max - copied, front.size() - front_offset_);
        std::memcpy(dest + copied, front.data() + front_offset_, n);
        copied += n;
        front_offset_ += n;
        buffered_ -= n;
        if (front_offset_ == front.size()) {
            chunks_.pop_front();
            front_offset_ = 0;
        }
    }
    if (copied > 0) {
        return copied;
    }
    if (failure_ != nullptr) {
        return tl::unexpected(*failure_);
    }
    return std::size_t{0};
}

void QueuedEntityStream::do_close() {
    std::lock_guard<std::mutex> lock(mutex_);
    reader_closed_ = true;
    chunks_.clear();
    front_offset_ = 0;
    buffered_ = 0;
    cv_.notify_all();
}

}  // namespace wirecall
