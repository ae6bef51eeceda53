#pragma once

#include "wirecall/core/error.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Closing Strategy
// ─────────────────────────────────────────────────────────────────────────────
// Invoked once when a response entity stream is closed. Typical use is to
// tell the transport whether the connection can be reused (body fully read)
// or must be dropped.

struct StreamCloseInfo {
    bool fully_consumed{false};
    bool failed{false};
};

using ClosingStrategy = std::function<void(const StreamCloseInfo&)>;

// ─────────────────────────────────────────────────────────────────────────────
// EntityStream
// ─────────────────────────────────────────────────────────────────────────────
// Inbound entity bytes, consumable once. close() is idempotent and safe to
// call from several threads: the first call releases the source and runs
// the closing strategy, later calls do nothing.

class EntityStream {
public:
    virtual ~EntityStream() = default;

    EntityStream(const EntityStream&) = delete;
    EntityStream& operator=(const EntityStream&) = delete;

    /// Up to max bytes into dest; 0 at end of data. Fails with the
    /// producer's fault, or Closed after close().
    [[nodiscard]] TransportResult<std::size_t> read(char* dest, std::size_t max);

    /// Drain the rest of the stream.
    [[nodiscard]] TransportResult<std::string> read_all();

    void close();

    [[nodiscard]] bool is_closed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool fully_consumed() const noexcept {
        return consumed_.load(std::memory_order_acquire);
    }

    /// Set before the stream is handed out; replaces any previous strategy.
    void set_closing_strategy(ClosingStrategy strategy) {
        closing_strategy_ = std::move(strategy);
    }

protected:
    EntityStream() = default;

    virtual TransportResult<std::size_t> do_read(char* dest, std::size_t max) = 0;
    virtual void do_close() = 0;
    [[nodiscard]] virtual bool has_failed() const { return false; }

private:
    std::atomic<bool> closed_{false};
    std::atomic<bool> consumed_{false};
    ClosingStrategy closing_strategy_;
};

// ─────────────────────────────────────────────────────────────────────────────
// BufferedEntityStream
// ─────────────────────────────────────────────────────────────────────────────

class BufferedEntityStream final : public EntityStream {
public:
    explicit BufferedEntityStream(std::string data = {});

    [[nodiscard]] std::string_view data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

protected:
    TransportResult<std::size_t> do_read(char* dest, std::size_t max) override;
    void do_close() override;

private:
    std::string data_;
    std::size_t position_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// QueuedEntityStream
// ─────────────────────────────────────────────────────────────────────────────
// Chunks pushed by a transport thread, read by the user thread. push()
// never blocks. Unbounded unless max_buffered_bytes is set; overflowing the
// cap fails the stream as if the producer had been interrupted.

class QueuedEntityStream final : public EntityStream {
public:
    enum class PushResult {
        Accepted,
        Discarded,  // stream already ended, failed or closed by the reader
        Overflow    // cap exceeded; the stream is now failed
    };

    explicit QueuedEntityStream(std::optional<std::size_t> max_buffered_bytes = std::nullopt);

    // Producer side
    [[nodiscard]] PushResult push(std::string chunk);
    void finish();
    void fail(std::shared_ptr<const TransportFault> cause);

    /// Cause the stream was failed with, if any.
    [[nodiscard]] std::shared_ptr<const TransportFault> failure() const;

    [[nodiscard]] std::size_t buffered_bytes() const;

protected:
    TransportResult<std::size_t> do_read(char* dest, std::size_t max) override;
    void do_close() override;
    [[nodiscard]] bool has_failed() const override;

private:
    const std::optional<std::size_t> max_buffered_bytes_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
    std::size_t front_offset_{0};
    std::size_t buffered_{0};
    bool finished_{false};
    bool reader_closed_{false};
    std::shared_ptr<const TransportFault> failure_;
};

}  // namespace wirecall
