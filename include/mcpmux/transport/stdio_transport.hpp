#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stdio Transport
// ═══════════════════════════════════════════════════════════════════════════
// Turns a server definition into a live, handshaked MCP session:
//
//   Idle -> ResolvingEnvironment -> LocatingCommand -> Spawning -> Handshaking
//        -> Connected | Failed | OAuthRequired
//
// Every attempt ends in exactly one ConnectOutcome. Failures carry a message
// meant for the end user (cause plus an optional remediation hint); nothing
// is thrown. Retrying is up to the caller.

#include "mcpmux/events/domain_event.hpp"
#include "mcpmux/log/server_log.hpp"
#include "mcpmux/platform/shell_env.hpp"
#include "mcpmux/process/child_spec.hpp"
#include "mcpmux/session/mcp_session.hpp"
#include "mcpmux/transport/child_stdio_transport.hpp"
#include "mcpmux/transport/command_hint.hpp"
#include "mcpmux/transport/transport_error.hpp"

#include <asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcpmux {

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct StdioTransportConfig {
    std::string command;
    std::vector<std::string> args;

    /// Set on top of the gateway's environment; a PATH here is never replaced
    EnvMap env;

    std::string server_id;
    std::string space_id;

    /// Bounds the handshake, measured from the moment the child is running
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};

    /// Receives connection entries, stderr lines and server log messages
    std::shared_ptr<IServerLogSink> log_sink;

    std::shared_ptr<IEventSink> event_sink;

    /// Null means McpSessionFactory with default settings
    std::shared_ptr<ISessionFactory> session_factory;

    /// Null means default_hint_registry()
    std::shared_ptr<const HintRegistry> hints;

    ChildStdioConfig stdio;
};

// ═══════════════════════════════════════════════════════════════════════════
// Outcome
// ═══════════════════════════════════════════════════════════════════════════

struct Connected {
    std::shared_ptr<IMcpSession> session;
};

struct Failed {
    std::string message;
};

struct OAuthRequired {
    std::string server_id;
    Json data;
};

using ConnectOutcome = std::variant<Connected, Failed, OAuthRequired>;

enum class ConnectState : std::uint8_t {
    Idle,
    ResolvingEnvironment,
    LocatingCommand,
    Spawning,
    Handshaking,
    Connected,
    Failed,
    OAuthRequired
};

[[nodiscard]] constexpr std::string_view to_string(ConnectState state) noexcept {
    switch (state) {
        case ConnectState::Idle:                 return "idle";
        case ConnectState::ResolvingEnvironment: return "resolving_environment";
        case ConnectState::LocatingCommand:      return "locating_command";
        case ConnectState::Spawning:             return "spawning";
        case ConnectState::Handshaking:          return "handshaking";
        case ConnectState::Connected:            return "connected";
        case ConnectState::Failed:               return "failed";
        case ConnectState::OAuthRequired:        return "oauth_required";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

/// Set PATH in `env` to the resolved path, unless `env` already has one or
/// there is nothing resolved.
void inject_shell_path(EnvMap& env, const ResolvedPath* path);

/// "30s" for whole seconds, "1500ms" otherwise
[[nodiscard]] std::string format_duration(std::chrono::milliseconds duration);

// ═══════════════════════════════════════════════════════════════════════════
// StdioTransport
// ═══════════════════════════════════════════════════════════════════════════

class StdioTransport {
public:
    explicit StdioTransport(StdioTransportConfig config);

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// One connection attempt. Runs on the awaiting coroutine's executor;
    /// the first ever call also blocks a helper thread on the login shell.
    [[nodiscard]] asio::awaitable<ConnectOutcome> connect();

    /// "stdio:<command>"
    [[nodiscard]] std::string description() const;

    [[nodiscard]] TransportType transport_type() const noexcept { return TransportType::Stdio; }

    /// Where the current (or last) attempt is
    [[nodiscard]] ConnectState state() const noexcept { return state_.load(); }

    [[nodiscard]] const StdioTransportConfig& config() const noexcept { return config_; }

private:
    void transition(ConnectState next);
    [[nodiscard]] std::string hint() const;
    void log_connection(LogLevel level, std::string message);
    void publish(DomainEventKind kind, Json detail = Json::object());
    [[nodiscard]] ConnectOutcome fail(std::string message);

    StdioTransportConfig config_;
    std::atomic<ConnectState> state_{ConnectState::Idle};
};

}  // namespace mcpmux
