#ifndef WIRECALL_TESTS_MOCKS_MOCK_TRANSPORT_HPP
#define WIRECALL_TESTS_MOCKS_MOCK_TRANSPORT_HPP

#include "wirecall/transport/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace wirecall::testing {

// ─────────────────────────────────────────────────────────────────────────────
// RecordedRequest - what the transport was asked to send
// ─────────────────────────────────────────────────────────────────────────────

struct RecordedRequest {
    std::string method;
    std::string url;
    HeaderFields headers;
    bool has_body{false};
    bool streaming{false};
    std::string body;
    std::string content_type;
    std::optional<std::size_t> declared_length;
    std::optional<std::string> body_error;
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::chrono::milliseconds> read_timeout;
    bool follow_redirects{true};

    /// Every value sent under name, in order.
    [[nodiscard]] std::vector<std::string> header_values(std::string_view name) const {
        std::vector<std::string> values;
        for (const auto& [key, value] : headers) {
            if (iequals(key, name)) {
                values.push_back(value);
            }
        }
        return values;
    }

    [[nodiscard]] std::size_t header_count(std::string_view name) const {
        return header_values(name).size();
    }
};

inline RecordedRequest record(const WireRequest& request) {
    RecordedRequest recorded;
    recorded.method = request.method;
    recorded.url = request.url;
    recorded.headers = request.headers;
    recorded.connect_timeout = request.connect_timeout;
    recorded.read_timeout = request.read_timeout;
    recorded.follow_redirects = request.follow_redirects;

    if (const auto* buffered = std::get_if<BufferedBody>(&request.body)) {
        recorded.has_body = true;
        recorded.body = buffered->bytes;
        recorded.content_type = buffered->content_type;
        recorded.declared_length = buffered->bytes.size();
    } else if (const auto* streaming = std::get_if<StreamingBody>(&request.body)) {
        recorded.has_body = true;
        recorded.streaming = true;
        recorded.content_type = streaming->content_type();
        recorded.declared_length = streaming->known_length();
        StringSink sink;
        auto written = streaming->write(sink);
        if (!written) {
            recorded.body_error = written.error();
        }
        recorded.body = sink.take();
    }
    return recorded;
}

// ─────────────────────────────────────────────────────────────────────────────
// MockExchange - an async exchange driven by the test
// ─────────────────────────────────────────────────────────────────────────────

class MockExchange final : public IExchange {
public:
    explicit MockExchange(std::shared_ptr<ITransportListener> listener)
        : listener_(std::move(listener))
    {}

    void abort() override {
        aborted_.store(true);
        abort_count_.fetch_add(1);
    }

    [[nodiscard]] bool was_aborted() const noexcept { return aborted_.load(); }
    [[nodiscard]] int abort_count() const noexcept { return abort_count_.load(); }

    // ─────────────────────────────────────────────────────────────────────────
    // Event injection
    // ─────────────────────────────────────────────────────────────────────────

    void headers(int status, HeaderFields fields = {}, std::optional<std::string> reason = std::nullopt) {
        listener_->on_event(HeadersEvent{status, std::move(reason), std::move(fields)});
    }

    void data(std::string chunk) {
        listener_->on_event(DataEvent{std::move(chunk)});
    }

    void complete(std::optional<std::string> resolved_url = std::nullopt) {
        listener_->on_event(CompleteEvent{std::move(resolved_url)});
    }

    void fail(std::shared_ptr<const TransportFault> cause) {
        listener_->on_event(FailureEvent{std::move(cause)});
    }

    void fail(TransportFault fault) {
        fail(std::make_shared<const TransportFault>(std::move(fault)));
    }

    /// Headers, one Data per chunk, Complete.
    void respond(int status, HeaderFields fields, const std::vector<std::string>& chunks) {
        headers(status, std::move(fields));
        for (const auto& chunk : chunks) {
            data(chunk);
        }
        complete();
    }

private:
    std::shared_ptr<ITransportListener> listener_;
    std::atomic<bool> aborted_{false};
    std::atomic<int> abort_count_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// MockTransport - scripted responses, recorded requests
// ─────────────────────────────────────────────────────────────────────────────

class MockTransport final : public ITransport {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    void queue_response(
        int status,
        std::string body = {},
        HeaderFields headers = {},
        std::optional<std::string> reason = std::nullopt
    ) {
        std::lock_guard<std::mutex> lock(mutex_);
        WireResponse response;
        response.status = status;
        response.reason = std::move(reason);
        response.headers = std::move(headers);
        response.body = std::move(body);
        scripted_.push_back(std::move(response));
    }

    void queue_fault(TransportFault fault) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripted_.push_back(std::move(fault));
    }

    void set_default_entity_processing(EntityProcessing mode) noexcept {
        default_processing_ = mode;
    }

    /// Make the next send_async() calls throw instead of registering.
    void set_throw_on_send_async(bool value) noexcept {
        throw_on_send_async_.store(value);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // ITransport
    // ─────────────────────────────────────────────────────────────────────────

    TransportResult<WireResponse> send(const WireRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(record(request));
        if (closed_) {
            return tl::unexpected(TransportFault::closed());
        }
        if (scripted_.empty()) {
            WireResponse response;
            response.status = 200;
            return response;
        }
        auto next = std::move(scripted_.front());
        scripted_.pop_front();
        if (auto* fault = std::get_if<TransportFault>(&next)) {
            return tl::unexpected(std::move(*fault));
        }
        return std::get<WireResponse>(std::move(next));
    }

    std::shared_ptr<IExchange> send_async(
        WireRequest request,
        std::shared_ptr<ITransportListener> listener
    ) override {
        if (throw_on_send_async_.load()) {
            throw std::runtime_error("exchange registry full");
        }
        auto exchange = std::make_shared<MockExchange>(std::move(listener));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(record(request));
            exchanges_.push_back(exchange);
        }
        cv_.notify_all();
        return exchange;
    }

    [[nodiscard]] std::string user_agent() const override { return "mock-agent/1.0"; }

    [[nodiscard]] EntityProcessing default_entity_processing() const noexcept override {
        return default_processing_;
    }

    [[nodiscard]] std::string name() const override { return "mock"; }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        ++close_count_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] RecordedRequest last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            throw std::runtime_error("no request recorded");
        }
        return requests_.back();
    }

    [[nodiscard]] std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] int close_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_count_;
    }

    /// Wait until the index-th async exchange was started.
    [[nodiscard]] std::shared_ptr<MockExchange> wait_for_exchange(
        std::size_t index = 0,
        std::chrono::milliseconds timeout = std::chrono::seconds(5)
    ) {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool arrived = cv_.wait_for(lock, timeout, [&]() { return exchanges_.size() > index; });
        if (arrived == false) {
            return nullptr;
        }
        return exchanges_[index];
    }

    [[nodiscard]] std::size_t exchange_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return exchanges_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::variant<WireResponse, TransportFault>> scripted_;
    std::vector<RecordedRequest> requests_;
    std::vector<std::shared_ptr<MockExchange>> exchanges_;
    EntityProcessing default_processing_{EntityProcessing::Buffered};
    std::atomic<bool> throw_on_send_async_{false};
    bool closed_{false};
    int close_count_{0};
};

}  // namespace wirecall::testing

#endif  // WIRECALL_TESTS_MOCKS_MOCK_TRANSPORT_HPP
