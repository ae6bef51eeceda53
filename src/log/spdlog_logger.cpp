#include "wirecall/log/spdlog_logger.hpp"

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <format>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace wirecall {

namespace {

constexpr const char* kPattern = "%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ [%n] %v (%s:%#)";

// Unregistered loggers still need distinct names for the %n field.
std::string next_name(std::string_view kind) {
    static std::atomic<std::uint32_t> sequence{0};
    return std::format("wirecall.{}.{}", kind, sequence.fetch_add(1, std::memory_order_relaxed));
}

std::shared_ptr<spdlog::logger> sink_logger(std::string_view kind, std::vector<spdlog::sink_ptr> sinks, LogLevel level) {
    auto logger = std::make_shared<spdlog::logger>(next_name(kind), sinks.begin(), sinks.end());
    logger->set_level(SpdlogLogger::to_spdlog_level(level));
    logger->set_pattern(kPattern);
    return logger;
}

std::shared_ptr<spdlog::details::thread_pool> shared_async_pool(std::size_t queue_size, std::size_t thread_count) {
    static std::mutex mutex;
    static std::shared_ptr<spdlog::details::thread_pool> pool;
    std::lock_guard<std::mutex> lock(mutex);
    if (pool == nullptr) {
        pool = std::make_shared<spdlog::details::thread_pool>(queue_size, thread_count == 0 ? 1 : thread_count);
    }
    return pool;
}

}  // namespace

// Index is the LogLevel value.
constexpr std::array<spdlog::level::level_enum, 7> kSpdlogLevels{
    spdlog::level::trace,
    spdlog::level::debug,
    spdlog::level::info,
    spdlog::level::warn,
    spdlog::level::err,
    spdlog::level::critical,
    spdlog::level::off,
};

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    return index < kSpdlogLevels.size() ? kSpdlogLevels[index] : spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    for (std::size_t i = 0; i < kSpdlogLevels.size(); ++i) {
        if (kSpdlogLevels[i] == level) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(LogLevel min_level)
    : SpdlogLogger(std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()}, min_level)
{}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(sink_logger("sinks", std::move(sinks), min_level))
    , filter_(min_level)
{}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , filter_(LogLevel::Info)
{
    if (logger_ == nullptr) {
        throw std::invalid_argument("SpdlogLogger requires a spdlog logger");
    }
    filter_.set_threshold(from_spdlog_level(logger_->level()));
}

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

void SpdlogLogger::log(const LogRecord& record) {
    const bool wanted = filter_.passes(record.level);
    if (wanted == false) {
        return;
    }

    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    const auto level = to_spdlog_level(record.level);
    if (record.request_id == 0) {
        logger_->log(where, level, "{}", record.message);
    } else {
        logger_->log(where, level, "[req {}] {}", record.request_id, record.message);
    }
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return filter_.passes(level);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    filter_.set_threshold(level);
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& filename, LogLevel min_level) {
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename);
    return std::make_unique<SpdlogLogger>(sink_logger("file", {file}, min_level));
}

std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level,
    std::size_t queue_size,
    std::size_t thread_count
) {
    auto logger = std::make_shared<spdlog::async_logger>(
        next_name("async"),
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
        shared_async_pool(queue_size, thread_count),
        spdlog::async_overflow_policy::block
    );
    logger->set_level(SpdlogLogger::to_spdlog_level(min_level));
    logger->set_pattern(kPattern);
    return std::make_unique<SpdlogLogger>(std::move(logger));
}

}  // namespace wirecall
