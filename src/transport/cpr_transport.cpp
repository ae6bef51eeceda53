#include "wirecall/transport/cpr_transport.hpp"
#include "wirecall/log/logger.hpp"

#include <asio/post.hpp>
#include <cpr/cpr.h>

#include <algorithm>
#include <charconv>
#include <functional>
#include <thread>

namespace wirecall {

namespace detail {

// ─────────────────────────────────────────────────────────────────────────────
// CookieStore
// ─────────────────────────────────────────────────────────────────────────────
// One jar per transport, shared by every exchange.

class CookieStore {
public:
    [[nodiscard]] cpr::Cookies snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cookies_;
    }

    void merge(const cpr::Cookies& received) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& cookie : received) {
            auto it = std::find_if(cookies_.begin(), cookies_.end(), [&cookie](const cpr::Cookie& held) {
                return held.GetName() == cookie.GetName() &&
                       held.GetDomain() == cookie.GetDomain() &&
                       held.GetPath() == cookie.GetPath();
            });
            if (it != cookies_.end()) {
                *it = cookie;
            } else {
                cookies_.emplace_back(cookie);
            }
        }
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::distance(cookies_.begin(), cookies_.end()));
    }

private:
    mutable std::mutex mutex_;
    // Values go back exactly as received.
    cpr::Cookies cookies_ = cpr::Cookies(false);
};

// ─────────────────────────────────────────────────────────────────────────────
// CprExchange
// ─────────────────────────────────────────────────────────────────────────────

class CprExchange final : public IExchange {
public:
    void abort() override {
        aborted_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool aborted() const noexcept {
        return aborted_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const std::atomic<bool>& aborted_flag() const noexcept { return aborted_; }

private:
    std::atomic<bool> aborted_{false};
};

}  // namespace detail

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Header Block Parsing
// ─────────────────────────────────────────────────────────────────────────────
// libcurl hands over every header line of every response it reads,
// including interim 1xx and redirect responses. A status line starts a new
// block, so what is left at the end belongs to the final response.

class HeaderBlockParser {
public:
    void feed(std::string_view line) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            return;
        }
        if (line.starts_with("HTTP/")) {
            start_block(line);
            return;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return;
        }
        auto name = line.substr(0, colon);
        auto value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
            value.remove_suffix(1);
        }
        fields_.emplace_back(std::string(name), std::string(value));
    }

    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] const std::optional<std::string>& reason() const noexcept { return reason_; }
    [[nodiscard]] const HeaderFields& fields() const noexcept { return fields_; }

private:
    // "HTTP/1.1 404 Not Found" or "HTTP/2 200"
    void start_block(std::string_view line) {
        fields_.clear();
        reason_.reset();
        status_ = 0;

        const auto first_space = line.find(' ');
        if (first_space == std::string_view::npos) {
            return;
        }
        auto rest = line.substr(first_space + 1);
        const auto second_space = rest.find(' ');
        const auto code = rest.substr(0, second_space);
        std::from_chars(code.data(), code.data() + code.size(), status_);
        if (second_space != std::string_view::npos) {
            auto phrase = rest.substr(second_space + 1);
            if (!phrase.empty()) {
                reason_ = std::string(phrase);
            }
        }
    }

    int status_{0};
    std::optional<std::string> reason_;
    HeaderFields fields_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Request Setup
// ─────────────────────────────────────────────────────────────────────────────

bool is_supported_method(std::string_view verb) {
    return verb == method::Get || verb == method::Head || verb == method::Post ||
           verb == method::Put || verb == method::Patch || verb == method::Delete ||
           verb == method::Options;
}

cpr::Header to_cpr_header(const HeaderFields& fields) {
    cpr::Header header;
    for (const auto& [name, value] : fields) {
        auto it = header.find(name);
        if (it == header.end()) {
            header.emplace(name, value);
        } else {
            it->second += ", ";
            it->second += value;
        }
    }
    return header;
}

cpr::Response perform(cpr::Session& session, std::string_view verb) {
    if (verb == method::Get)     return session.Get();
    if (verb == method::Head)    return session.Head();
    if (verb == method::Post)    return session.Post();
    if (verb == method::Put)     return session.Put();
    if (verb == method::Patch)   return session.Patch();
    if (verb == method::Delete)  return session.Delete();
    return session.Options();
}

// Same classification as for every cpr failure: TLS trouble by message,
// then timeouts, everything else is a connection failure.
TransportFault map_error(const cpr::Error& error) {
    const std::string& msg = error.message;
    const bool is_ssl_error =
        (msg.find("SSL") != std::string::npos) ||
        (msg.find("ssl") != std::string::npos) ||
        (msg.find("certificate") != std::string::npos) ||
        (msg.find("TLS") != std::string::npos);

    if (is_ssl_error) {
        return TransportFault::ssl_error(msg);
    }

    switch (error.code) {
        case cpr::ErrorCode::OK:
            return TransportFault::unknown("No error");
        case cpr::ErrorCode::OPERATION_TIMEDOUT:
            return TransportFault::timeout(msg);
        case cpr::ErrorCode::SSL_CONNECT_ERROR:
            return TransportFault::ssl_error(msg);
        default:
            return TransportFault::connection_failed(msg);
    }
}

struct ExchangeOutcome {
    cpr::Response response;
    std::optional<std::string> entity_error;
};

// Runs one exchange to the end on the calling thread. on_data returning
// false stops the transfer.
ExchangeOutcome execute(
    const TransportConfig& config,
    detail::CookieStore* cookies,
    const WireRequest& request,
    HeaderBlockParser& parser,
    const std::function<bool(std::string_view)>& on_data,
    const std::atomic<bool>& aborted
) {
    cpr::Session session;
    session.SetUrl(cpr::Url{request.url});
    session.SetHeader(to_cpr_header(request.headers));
    session.SetRedirect(cpr::Redirect{request.follow_redirects});
    session.SetVerifySsl(cpr::VerifySsl{config.verify_tls});

    const auto connect_timeout = request.connect_timeout.value_or(config.connect_timeout);
    if (connect_timeout.count() > 0) {
        session.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout});
    }
    const auto read_timeout = request.read_timeout.value_or(config.read_timeout);
    if (read_timeout.count() > 0) {
        session.SetTimeout(cpr::Timeout{read_timeout});
    }

    if (config.proxy.has_value()) {
        const auto& proxy = *config.proxy;
        session.SetProxies(cpr::Proxies{{"http", proxy.uri}, {"https", proxy.uri}});
        if (proxy.username.has_value()) {
            const std::string password = proxy.password.value_or("");
            session.SetProxyAuth(cpr::ProxyAuthentication{
                {"http", cpr::EncodedAuthentication{*proxy.username, password}},
                {"https", cpr::EncodedAuthentication{*proxy.username, password}}
            });
        }
    }

    const auto* streaming = std::get_if<StreamingBody>(&request.body);
    if (config.credentials.has_value()) {
        // A streaming body cannot be rewound for a challenge round-trip.
        const bool preemptive = config.preemptive_basic_auth || (streaming != nullptr);
        session.SetAuth(cpr::Authentication{
            config.credentials->username,
            config.credentials->password,
            preemptive ? cpr::AuthMode::BASIC : cpr::AuthMode::ANY
        });
    }

    if (cookies != nullptr) {
        session.SetCookies(cookies->snapshot());
    }

    session.SetHeaderCallback(cpr::HeaderCallback{
        [&parser, &aborted](std::string_view line, intptr_t /*userdata*/) {
            if (aborted.load(std::memory_order_acquire)) {
                return false;
            }
            parser.feed(line);
            return true;
        }
    });
    session.SetWriteCallback(cpr::WriteCallback{
        [&on_data](std::string_view data, intptr_t /*userdata*/) {
            return on_data(data);
        }
    });
    session.SetProgressCallback(cpr::ProgressCallback{
        [&aborted](cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) {
            return aborted.load(std::memory_order_acquire) == false;
        }
    });

    if (const auto* buffered = std::get_if<BufferedBody>(&request.body)) {
        session.SetBody(cpr::Body{buffered->bytes});
    }

    ExchangeOutcome outcome;
    if (streaming == nullptr) {
        outcome.response = perform(session, request.method);
    } else {
        BodyPipe pipe(config.upload_pipe_capacity);
        auto pull = [&pipe, &aborted](char* buffer, std::size_t& size, intptr_t /*userdata*/) {
            if (aborted.load(std::memory_order_acquire)) {
                return false;
            }
            size = pipe.read(buffer, size);
            // Ending the upload on a failed writer would send a truncated
            // body as if it were complete.
            return !(size == 0 && pipe.error().has_value());
        };
        const auto length = streaming->known_length();
        if (length.has_value()) {
            session.SetReadCallback(cpr::ReadCallback{static_cast<cpr::cpr_off_t>(*length), pull});
        } else {
            session.SetReadCallback(cpr::ReadCallback{pull});
        }

        std::thread writer([&pipe, streaming]() { pipe.pump(*streaming); });
        outcome.response = perform(session, request.method);
        pipe.abort();
        writer.join();
        outcome.entity_error = pipe.error();
    }

    const bool succeeded = (outcome.response.error.code == cpr::ErrorCode::OK);
    if (cookies != nullptr && succeeded) {
        cookies->merge(outcome.response.cookies);
    }
    return outcome;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

CprTransport::CprTransport(TransportConfig config)
    : config_(std::move(config))
{
    config_.validate();
    if (config_.disable_cookies == false) {
        cookies_ = std::make_unique<detail::CookieStore>();
    }
    pool_ = std::make_unique<asio::thread_pool>(config_.worker_threads);
    get_logger().debug_fmt("CprTransport created with {} worker threads", config_.worker_threads);
}

CprTransport::~CprTransport() {
    close();
}

std::string CprTransport::name() const {
    return std::string("cpr ") + CPR_VERSION;
}

std::size_t CprTransport::cookie_count() const {
    return cookies_ ? cookies_->size() : 0;
}

// ─────────────────────────────────────────────────────────────────────────────
// Blocking Send
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<WireResponse> CprTransport::send(const WireRequest& request) {
    if (closed_.load()) {
        return tl::unexpected(TransportFault::closed());
    }
    if (is_supported_method(request.method) == false) {
        return tl::unexpected(TransportFault::unsupported(
            "Method not supported by cpr transport: " + request.method));
    }

    const std::atomic<bool> never_aborted{false};
    const auto cap = config_.sync_response_max_size;
    std::string body;
    bool too_large = false;
    auto on_data = [&body, &too_large, cap](std::string_view data) {
        const bool over_cap = cap.has_value() && (body.size() + data.size() > *cap);
        if (over_cap) {
            too_large = true;
            return false;
        }
        body.append(data);
        return true;
    };

    HeaderBlockParser parser;
    auto outcome = execute(config_, cookies_.get(), request, parser, on_data, never_aborted);

    if (too_large) {
        return tl::unexpected(TransportFault::response_too_large(
            "Response body exceeds " + std::to_string(*cap) + " bytes"));
    }
    if (outcome.entity_error.has_value()) {
        return tl::unexpected(TransportFault::entity_write(*outcome.entity_error));
    }
    if (outcome.response.error.code != cpr::ErrorCode::OK) {
        auto fault = map_error(outcome.response.error);
        get_logger().debug_fmt("{} {} failed: {}", request.method, request.url, fault.message);
        return tl::unexpected(std::move(fault));
    }

    WireResponse response;
    response.status = (parser.status() != 0) ? parser.status()
                                             : static_cast<int>(outcome.response.status_code);
    response.reason = parser.reason();
    response.headers = parser.fields();
    response.body = std::move(body);
    response.resolved_url = outcome.response.url.str();
    return response;
}

// ─────────────────────────────────────────────────────────────────────────────
// Non-blocking Send
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<IExchange> CprTransport::send_async(
    WireRequest request,
    std::shared_ptr<ITransportListener> listener
) {
    auto exchange = std::make_shared<detail::CprExchange>();

    if (closed_.load()) {
        listener->on_event(FailureEvent{std::make_shared<const TransportFault>(TransportFault::closed())});
        return exchange;
    }
    if (is_supported_method(request.method) == false) {
        listener->on_event(FailureEvent{std::make_shared<const TransportFault>(
            TransportFault::unsupported("Method not supported by cpr transport: " + request.method))});
        return exchange;
    }

    track(exchange);
    asio::post(*pool_, [this, request = std::move(request), listener, exchange]() {
        run_async(request, *listener, *exchange);
    });
    return exchange;
}

void CprTransport::run_async(
    const WireRequest& request,
    ITransportListener& listener,
    detail::CprExchange& exchange
) {
    auto fail = [&listener](TransportFault fault) {
        listener.on_event(FailureEvent{std::make_shared<const TransportFault>(std::move(fault))});
    };

    if (exchange.aborted() || closed_.load()) {
        fail(TransportFault::aborted());
        return;
    }

    HeaderBlockParser parser;
    bool headers_sent = false;
    auto emit_headers = [&]() {
        if (headers_sent) {
            return;
        }
        headers_sent = true;
        listener.on_event(HeadersEvent{parser.status(), parser.reason(), parser.fields()});
    };
    auto on_data = [&](std::string_view data) {
        if (exchange.aborted()) {
            return false;
        }
        emit_headers();
        listener.on_event(DataEvent{std::string(data)});
        return true;
    };

    auto outcome = execute(config_, cookies_.get(), request, parser, on_data, exchange.aborted_flag());

    if (exchange.aborted()) {
        fail(TransportFault::aborted());
        return;
    }
    if (outcome.entity_error.has_value()) {
        fail(TransportFault::entity_write(*outcome.entity_error));
        return;
    }
    if (outcome.response.error.code != cpr::ErrorCode::OK) {
        fail(map_error(outcome.response.error));
        return;
    }
    emit_headers();
    listener.on_event(CompleteEvent{outcome.response.url.str()});
}

void CprTransport::track(const std::shared_ptr<detail::CprExchange>& exchange) {
    std::lock_guard<std::mutex> lock(exchanges_mutex_);
    std::erase_if(exchanges_, [](const auto& weak) { return weak.expired(); });
    exchanges_.push_back(exchange);
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

void CprTransport::close() {
    const bool already_closed = closed_.exchange(true);
    if (already_closed) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(exchanges_mutex_);
        for (const auto& weak : exchanges_) {
            if (auto exchange = weak.lock()) {
                exchange->abort();
            }
        }
        exchanges_.clear();
    }

    pool_->join();
    get_logger().debug("CprTransport closed");
}

}  // namespace wirecall
