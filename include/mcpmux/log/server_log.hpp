#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Log Entries
// ═══════════════════════════════════════════════════════════════════════════
// Per-server log lines shown to the user in the desktop log viewer. These
// are separate from the internal diagnostic logger (logger.hpp): entries are
// filed under a (space, server) pair and handed to an IServerLogSink.

#include "mcpmux/log/logger.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace mcpmux {

using Json = nlohmann::json;

/// Where a server log line came from
enum class LogSource : std::uint8_t {
    Connection,  // Written by the gateway while connecting
    Stderr,      // A line the child wrote to its stderr
    Server       // An MCP logging notification sent by the server
};

[[nodiscard]] constexpr std::string_view to_string(LogSource source) noexcept {
    switch (source) {
        case LogSource::Connection: return "connection";
        case LogSource::Stderr:     return "stderr";
        case LogSource::Server:     return "server";
    }
    return "unknown";
}

[[nodiscard]] std::optional<LogSource> parse_log_source(std::string_view name) noexcept;

struct ServerLog {
    LogLevel level{LogLevel::Info};
    LogSource source{LogSource::Connection};
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    ServerLog() = default;
    ServerLog(LogLevel lvl, LogSource src, std::string msg)
        : level(lvl)
        , source(src)
        , message(std::move(msg))
    {}

    /// {"ts": <unix millis>, "level": "WARN", "source": "stderr", "message": "..."}
    [[nodiscard]] Json to_json() const;
    static std::optional<ServerLog> from_json(const Json& j);
};

struct SinkError {
    std::string message;
};

template <typename T>
using SinkResult = tl::expected<T, SinkError>;

// ─────────────────────────────────────────────────────────────────────────────
// IServerLogSink
// ─────────────────────────────────────────────────────────────────────────────
// Shared by every connection attempt and every stderr reader in the process:
// implementations must accept concurrent append() calls and never interleave
// partial entries.

class IServerLogSink {
public:
    virtual ~IServerLogSink() = default;

    virtual SinkResult<void> append(
        std::string_view space_id,
        std::string_view server_id,
        const ServerLog& entry
    ) = 0;
};

}  // namespace mcpmux
