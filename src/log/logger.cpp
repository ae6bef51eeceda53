#include "wirecall/log/logger.hpp"

#include "wirecall/core/request_scope.hpp"

#include <array>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <new>
#include <vector>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────────────────────────────

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    std::array<char, 8> lowered{};
    if (text.empty() || text.size() > lowered.size()) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        lowered[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
    }
    const std::string_view name(lowered.data(), text.size());

    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

LogLevel log_level_from_env(LogLevel fallback) {
    const char* value = std::getenv("WIRECALL_LOG_LEVEL");
    if (value == nullptr) {
        return fallback;
    }
    return parse_log_level(value).value_or(fallback);
}

LogRecord LogRecord::capture(LogLevel level, std::string message, std::source_location location) {
    LogRecord record;
    record.level = level;
    record.message = std::move(message);
    record.timestamp = std::chrono::system_clock::now();
    record.location = location;
    if (const RequestContext* scope = RequestScope::current()) {
        record.request_id = scope->id;
    }
    return record;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct LoggerSlot {
    std::mutex mutex;
    NullLogger silent;
    std::atomic<ILogger*> active{&silent};
    // Loggers that were replaced; kept so outstanding references stay valid.
    std::vector<std::unique_ptr<ILogger>> retired;
    std::unique_ptr<ILogger> installed;
};

LoggerSlot& slot() {
    static LoggerSlot instance;
    return instance;
}

}  // namespace

ILogger& get_logger() noexcept {
    return *slot().active.load(std::memory_order_acquire);
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    LoggerSlot& s = slot();
    std::lock_guard<std::mutex> lock(s.mutex);

    ILogger* next = logger ? logger.get() : &s.silent;
    s.active.store(next, std::memory_order_release);

    if (s.installed) {
        try {
            s.retired.push_back(std::move(s.installed));
        } catch (const std::bad_alloc&) {
            // Cannot retire it; keep it alive rather than free it under a reader.
            static_cast<void>(s.installed.release());
        }
    }
    s.installed = std::move(logger);
}

}  // namespace wirecall
