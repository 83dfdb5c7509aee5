#pragma once

#include "mcpmux/log/logger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace mcpmux {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - production backend for the internal logger
// ─────────────────────────────────────────────────────────────────────────────

class SpdlogLogger final : public ILogger {
public:
    /// Console (stderr, colored) sink
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Several sinks at once
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    ~SpdlogLogger() override = default;

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
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct LoggingConfig {
    LogLevel level{LogLevel::Info};

    /// Also write to this file when set
    std::optional<std::string> file;

    /// Keep the console sink (stderr)
    bool console{true};

    /// Route records through spdlog's background thread pool
    bool async{false};
    std::size_t async_queue_size{8192};
};

/// Build a logger from a LoggingConfig. Throws spdlog::spdlog_ex when the
/// log file cannot be opened.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_logger(const LoggingConfig& config);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace mcpmux
