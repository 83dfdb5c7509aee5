// ─────────────────────────────────────────────────────────────────────────────
// Internal Logger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpmux/log/logger.hpp"

#include <string>
#include <vector>

using namespace mcpmux;

namespace {

/// Records everything at or above its threshold
class CapturingLogger final : public ILogger {
public:
    explicit CapturingLogger(LogLevel threshold = LogLevel::Trace)
        : threshold_(threshold)
    {}

    void log(const LogRecord& record) override {
        records.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold_);
    }

    std::vector<LogRecord> records;

private:
    LogLevel threshold_;
};

/// Installs a CapturingLogger globally for one test and restores the default
class ScopedCapture {
public:
    explicit ScopedCapture(LogLevel threshold = LogLevel::Trace) {
        auto logger = std::make_unique<CapturingLogger>(threshold);
        logger_ = logger.get();
        set_logger(std::move(logger));
    }

    ~ScopedCapture() { set_logger(nullptr); }

    ScopedCapture(const ScopedCapture&) = delete;
    ScopedCapture& operator=(const ScopedCapture&) = delete;

    [[nodiscard]] const std::vector<LogRecord>& records() const { return logger_->records; }

private:
    CapturingLogger* logger_;
};

}  // namespace

TEST_CASE("LogLevel names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Fatal) == "FATAL");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level accepts common spellings", "[log]") {
    REQUIRE(parse_log_level("trace") == LogLevel::Trace);
    REQUIRE(parse_log_level("DEBUG") == LogLevel::Debug);
    REQUIRE(parse_log_level("Info") == LogLevel::Info);
    REQUIRE(parse_log_level("warn") == LogLevel::Warn);
    REQUIRE(parse_log_level("warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("err") == LogLevel::Error);
    REQUIRE(parse_log_level("critical") == LogLevel::Fatal);
    REQUIRE(parse_log_level("off") == LogLevel::Off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("The default global logger drops everything", "[log]") {
    set_logger(nullptr);
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Fatal));

    // Must be harmless with nothing installed
    MCPMUX_LOG_ERROR("Failed to spawn process");
}

TEST_CASE("write filters below the threshold", "[log]") {
    CapturingLogger logger(LogLevel::Warn);

    logger.write(LogLevel::Debug, "Transition idle -> spawning");
    logger.write(LogLevel::Warn, "Shell PATH unavailable");

    REQUIRE(logger.records.size() == 1);
    REQUIRE(logger.records[0].level == LogLevel::Warn);
    REQUIRE(logger.records[0].message == "Shell PATH unavailable");
}

TEST_CASE("LogRecord carries call site and time", "[log]") {
    CapturingLogger logger;

    const auto before = std::chrono::system_clock::now();
    logger.write(LogLevel::Info, "connecting");
    const auto after = std::chrono::system_clock::now();

    REQUIRE(logger.records.size() == 1);
    const auto& record = logger.records[0];
    REQUIRE(std::string_view(record.location.file_name()).find("logger_test") != std::string_view::npos);
    REQUIRE(record.location.line() > 0);
    REQUIRE(record.timestamp >= before);
    REQUIRE(record.timestamp <= after);
}

TEST_CASE("MCPMUX_LOG macros reach the installed logger", "[log]") {
    ScopedCapture capture(LogLevel::Debug);

    MCPMUX_LOG_TRACE("trace");
    MCPMUX_LOG_DEBUG("debug");
    MCPMUX_LOG_INFO("info");
    MCPMUX_LOG_WARN("warn");
    MCPMUX_LOG_ERROR("error");
    MCPMUX_LOG_FATAL("fatal");

    const auto& records = capture.records();
    REQUIRE(records.size() == 5);
    REQUIRE(records.front().level == LogLevel::Debug);
    REQUIRE(records.back().level == LogLevel::Fatal);
}

TEST_CASE("MCPMUX_LOG macros skip message construction when filtered", "[log]") {
    ScopedCapture capture(LogLevel::Error);

    int evaluated = 0;
    auto expensive = [&]() {
        ++evaluated;
        return std::string("built");
    };

    MCPMUX_LOG_DEBUG(expensive());
    REQUIRE(evaluated == 0);

    MCPMUX_LOG_ERROR(expensive());
    REQUIRE(evaluated == 1);
    REQUIRE(capture.records().size() == 1);
    REQUIRE(capture.records()[0].message == "built");
}

TEST_CASE("Formatted helpers render arguments", "[log]") {
    CapturingLogger logger(LogLevel::Debug);

    logger.info_fmt("{} entries from {}", 12, "/bin/zsh");
    logger.debug_fmt("[{}] {} -> {}", "github", "idle", "spawning");
    logger.error_fmt("[{}] Connection timeout ({})", "github", "30s");

    REQUIRE(logger.records.size() == 3);
    REQUIRE(logger.records[0].message == "12 entries from /bin/zsh");
    REQUIRE(logger.records[1].message == "[github] idle -> spawning");
    REQUIRE(logger.records[2].level == LogLevel::Error);
}

TEST_CASE("Formatted helpers skip formatting when filtered", "[log]") {
    CapturingLogger logger(LogLevel::Error);

    logger.debug_fmt("{}", "hidden");
    logger.info_fmt("{}", "hidden");

    REQUIRE(logger.records.empty());
}
