#pragma once

#include "wxstream/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace wxstream {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by an spdlog::logger
// ─────────────────────────────────────────────────────────────────────────────
// Source locations captured by the WXSTREAM_LOG_* macros are forwarded to
// spdlog, so "%s:%#" in a pattern resolves to the stream component's file.

class SpdlogLogger final : public ILogger {
public:
    static constexpr const char* kDefaultPattern = "[%H:%M:%S.%e] [%^%l%$] [%t] [%s:%#] %v";

    /// Colored stdout sink.
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wraps an existing logger; its current level becomes the threshold.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;
    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;
    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

/// Console plus an appending file sink (the CLI's --log-file).
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info,
    bool also_console = false
);

/// Non-blocking console logger; frame-level trace logging from the reader
/// thread goes through spdlog's shared thread pool instead of stderr.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_logger(
    LogLevel min_level = LogLevel::Info,
    std::size_t queue_size = 8192
);

}  // namespace wxstream
