#pragma once

#include "wirecall/log/logger.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// Routes library records into spdlog. Records emitted inside a RequestScope
// are prefixed with "[req N] " so interleaved invocations can be told apart.
// The spdlog loggers created here are never registered, so any number of
// them can coexist.

class SpdlogLogger final : public ILogger {
public:
    /// Colored stdout
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Adopts logger and its current level. Throws std::invalid_argument on null.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;
    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    void set_level(LogLevel level) noexcept;
    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept { return logger_; }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LevelFilter filter_;
};

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level = LogLevel::Info);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Console logger whose records are written by a background spdlog thread,
/// so transport I/O threads never block on the terminal. The thread pool is
/// shared by every async logger; the first call sizes it.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level = LogLevel::Info,
    std::size_t queue_size = 8192,
    std::size_t thread_count = 1
);

}  // namespace wirecall
