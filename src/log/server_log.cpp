#include "mcpmux/log/server_log.hpp"

namespace mcpmux {

std::optional<LogSource> parse_log_source(std::string_view name) noexcept {
    if (name == "connection") return LogSource::Connection;
    if (name == "stderr") return LogSource::Stderr;
    if (name == "server") return LogSource::Server;
    return std::nullopt;
}

Json ServerLog::to_json() const {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()
    ).count();
    return {
        {"ts", millis},
        {"level", std::string(to_string(level))},
        {"source", std::string(to_string(source))},
        {"message", message}
    };
}

std::optional<ServerLog> ServerLog::from_json(const Json& j) {
    if (!j.is_object() || !j.contains("message") || !j["message"].is_string()) {
        return std::nullopt;
    }

    std::optional<LogLevel> level = LogLevel::Info;
    if (j.contains("level")) {
        level = j["level"].is_string()
            ? parse_log_level(j["level"].get<std::string>())
            : std::nullopt;
    }
    std::optional<LogSource> source = LogSource::Connection;
    if (j.contains("source")) {
        source = j["source"].is_string()
            ? parse_log_source(j["source"].get<std::string>())
            : std::nullopt;
    }
    if (!level || !source) {
        return std::nullopt;
    }

    ServerLog log(*level, *source, j["message"].get<std::string>());
    if (j.contains("ts") && j["ts"].is_number_integer()) {
        log.timestamp = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(j["ts"].get<std::int64_t>())
        );
    }
    return log;
}

}  // namespace mcpmux
