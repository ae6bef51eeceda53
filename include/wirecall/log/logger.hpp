#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // transport events and body chunks
    Debug = 1,  // invocation lifecycle
    Info  = 2,  // connector open/close
    Warn  = 3,  // suppressed validation, ignored property values
    Error = 4,  // failed exchanges, throwing callbacks
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Case-insensitive inverse of to_string(); also accepts "warning".
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// Level named by the WIRECALL_LOG_LEVEL environment variable, or fallback
/// when it is unset or unrecognized.
[[nodiscard]] LogLevel log_level_from_env(LogLevel fallback = LogLevel::Info);

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level{LogLevel::Info};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;
    // Id of the innermost RequestScope on the emitting thread, 0 outside one.
    std::uint64_t request_id{0};

    /// Stamps the current time and request scope.
    [[nodiscard]] static LogRecord capture(LogLevel level, std::string message, std::source_location location);
};

// ─────────────────────────────────────────────────────────────────────────────
// LocatedFormat
// ─────────────────────────────────────────────────────────────────────────────
// A compile-time checked format string that also records where it was
// written, so formatted records point at the caller.

template<typename... Args>
struct LocatedFormat {
    template<typename S>
        requires std::convertible_to<const S&, std::string_view>
    consteval LocatedFormat(const S& text, std::source_location where = std::source_location::current())
        : format(text)
        , location(where)
    {}

    std::format_string<Args...> format;
    std::source_location location;
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────
// Library code never writes to stdout or stderr itself; everything is routed
// through the globally installed ILogger.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord::capture(level, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) { write(LogLevel::Trace, msg, loc); }
    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) { write(LogLevel::Debug, msg, loc); }
    void info(std::string_view msg, std::source_location loc = std::source_location::current()) { write(LogLevel::Info, msg, loc); }
    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) { write(LogLevel::Warn, msg, loc); }
    void error(std::string_view msg, std::source_location loc = std::source_location::current()) { write(LogLevel::Error, msg, loc); }

    // Formatting is skipped entirely when the level is filtered out.
    template<typename... Args>
    void write_fmt(LogLevel level, LocatedFormat<std::type_identity_t<Args>...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord::capture(level, std::format(fmt.format, std::forward<Args>(args)...), fmt.location));
        }
    }

    template<typename... Args>
    void trace_fmt(LocatedFormat<std::type_identity_t<Args>...> fmt, Args&&... args) { write_fmt<Args...>(LogLevel::Trace, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void debug_fmt(LocatedFormat<std::type_identity_t<Args>...> fmt, Args&&... args) { write_fmt<Args...>(LogLevel::Debug, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void info_fmt(LocatedFormat<std::type_identity_t<Args>...> fmt, Args&&... args) { write_fmt<Args...>(LogLevel::Info, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void warn_fmt(LocatedFormat<std::type_identity_t<Args>...> fmt, Args&&... args) { write_fmt<Args...>(LogLevel::Warn, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void error_fmt(LocatedFormat<std::type_identity_t<Args>...> fmt, Args&&... args) { write_fmt<Args...>(LogLevel::Error, fmt, std::forward<Args>(args)...); }
};

// ─────────────────────────────────────────────────────────────────────────────
// LevelFilter
// ─────────────────────────────────────────────────────────────────────────────
// Threshold shared by the concrete loggers. Adjustable while other threads
// are logging.

class LevelFilter {
public:
    explicit LevelFilter(LogLevel min_level) noexcept : min_level_(min_level) {}

    [[nodiscard]] bool passes(LogLevel level) const noexcept {
        const LogLevel threshold = min_level_.load(std::memory_order_relaxed);
        return level != LogLevel::Off && threshold != LogLevel::Off && level >= threshold;
    }

    [[nodiscard]] LogLevel threshold() const noexcept { return min_level_.load(std::memory_order_relaxed); }
    void set_threshold(LogLevel level) noexcept { min_level_.store(level, std::memory_order_relaxed); }

private:
    std::atomic<LogLevel> min_level_;
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord&) override {}
    [[nodiscard]] bool should_log(LogLevel) const noexcept override { return false; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

/// The installed logger. A reference stays valid after the logger is
/// replaced; replaced loggers are retired, not destroyed.
[[nodiscard]] ILogger& get_logger() noexcept;

/// Installs logger; nullptr reinstalls the silent default.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define WIRECALL_LOG_AT(level, msg) \
    do { auto& wirecall_logger_ = ::wirecall::get_logger(); \
         if (wirecall_logger_.should_log(level)) wirecall_logger_.write(level, msg); } while (false)

#define WIRECALL_LOG_TRACE(msg) WIRECALL_LOG_AT(::wirecall::LogLevel::Trace, msg)
#define WIRECALL_LOG_DEBUG(msg) WIRECALL_LOG_AT(::wirecall::LogLevel::Debug, msg)
#define WIRECALL_LOG_INFO(msg)  WIRECALL_LOG_AT(::wirecall::LogLevel::Info, msg)
#define WIRECALL_LOG_WARN(msg)  WIRECALL_LOG_AT(::wirecall::LogLevel::Warn, msg)
#define WIRECALL_LOG_ERROR(msg) WIRECALL_LOG_AT(::wirecall::LogLevel::Error, msg)

}  // namespace wirecall
