#include "mcpmux/transport/stdio_transport.hpp"
#include "mcpmux/diagnostics/stderr_pipeline.hpp"
#include "mcpmux/log/logger.hpp"
#include "mcpmux/platform/command_locator.hpp"
#include "mcpmux/platform/process_platform.hpp"
#include "mcpmux/process/child_process.hpp"

#include <asio/co_spawn.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/thread_pool.hpp>
#include <asio/use_awaitable.hpp>

namespace mcpmux {

using namespace asio::experimental::awaitable_operators;

namespace {

/// Runs the one-time login shell query so it never blocks an I/O thread.
asio::thread_pool& resolver_pool() {
    static asio::thread_pool pool(1);
    return pool;
}

asio::awaitable<const std::optional<ResolvedPath>*> resolve_on_pool() {
    co_return &get_shell_path();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

void inject_shell_path(EnvMap& env, const ResolvedPath* path) {
    if (env.count("PATH") != 0 || path == nullptr || path->empty()) {
        return;
    }
    env["PATH"] = path->to_string();
}

std::string format_duration(std::chrono::milliseconds duration) {
    const auto ms = duration.count();
    if (ms > 0 && ms % 1000 == 0) {
        return std::to_string(ms / 1000) + "s";
    }
    return std::to_string(ms) + "ms";
}

// ═══════════════════════════════════════════════════════════════════════════
// StdioTransport
// ═══════════════════════════════════════════════════════════════════════════

StdioTransport::StdioTransport(StdioTransportConfig config)
    : config_(std::move(config))
{}

std::string StdioTransport::description() const {
    return "stdio:" + config_.command;
}

void StdioTransport::transition(ConnectState next) {
    const auto previous = state_.exchange(next);
    get_logger().debug_fmt(
        "[{}] {} -> {}",
        config_.server_id,
        to_string(previous),
        to_string(next)
    );
}

std::string StdioTransport::hint() const {
    return config_.hints ? config_.hints->hint_for(config_.command)
                         : command_hint(config_.command);
}

void StdioTransport::log_connection(LogLevel level, std::string message) {
    if (!config_.log_sink) {
        return;
    }
    auto appended = config_.log_sink->append(
        config_.space_id,
        config_.server_id,
        ServerLog(level, LogSource::Connection, std::move(message))
    );
    if (!appended) {
        MCPMUX_LOG_ERROR("Failed to write server log: " + appended.error().message);
    }
}

void StdioTransport::publish(DomainEventKind kind, Json detail) {
    if (config_.event_sink) {
        config_.event_sink->publish(DomainEvent{
            kind, config_.space_id, config_.server_id, std::move(detail)
        });
    }
}

ConnectOutcome StdioTransport::fail(std::string message) {
    transition(ConnectState::Failed);
    get_logger().error_fmt("[{}] {}", config_.server_id, message);
    log_connection(LogLevel::Error, message);
    publish(DomainEventKind::ServerConnectFailed, Json{{"error", message}});
    return Failed{std::move(message)};
}

asio::awaitable<ConnectOutcome> StdioTransport::connect() {
    state_ = ConnectState::Idle;
    auto executor = co_await asio::this_coro::executor;

    get_logger().info_fmt(
        "Connecting to stdio server {} ({})",
        config_.server_id,
        config_.command
    );
    log_connection(
        LogLevel::Info,
        "Connecting to server: " + config_.command + " " + Json(config_.args).dump()
    );
    publish(DomainEventKind::ServerConnecting);

    // ─────────────────────────────────────────────────────────────────────
    // Environment
    // ─────────────────────────────────────────────────────────────────────
    transition(ConnectState::ResolvingEnvironment);

    const std::optional<ResolvedPath>* resolved = nullptr;
    if (shell_path_ready()) {
        resolved = &get_shell_path();
    } else {
        resolved = co_await asio::co_spawn(resolver_pool(), resolve_on_pool(), asio::use_awaitable);
    }
    const ResolvedPath* shell_path = resolved->has_value() ? &resolved->value() : nullptr;

    // ─────────────────────────────────────────────────────────────────────
    // Command lookup
    // ─────────────────────────────────────────────────────────────────────
    transition(ConnectState::LocatingCommand);

    auto located = locate_command(config_.command, shell_path);
    if (!located) {
        co_return fail("Command not found: " + config_.command
                       + ". Ensure it's installed and in PATH." + hint());
    }
    MCPMUX_LOG_DEBUG("Found command " + located->string());

    // ─────────────────────────────────────────────────────────────────────
    // Spawn
    // ─────────────────────────────────────────────────────────────────────
    transition(ConnectState::Spawning);

    ChildSpec spec;
    spec.program = located->string();
    spec.args = config_.args;
    spec.env = config_.env;
    inject_shell_path(spec.env, shell_path);
    spec.stdin_mode = StdioMode::Pipe;
    spec.stdout_mode = StdioMode::Pipe;
    // Without a sink nobody drains stderr; a full pipe would stall the child.
    spec.stderr_mode = config_.log_sink ? StdioMode::Pipe : StdioMode::Null;
    spec.kill_on_drop = true;
    current_platform().configure(spec);

    auto child = ChildProcess::spawn(spec);
    if (!child) {
        co_return fail("Failed to spawn process: " + child.error().message + "." + hint());
    }

    std::unique_ptr<IAsyncTransport> transport;
    try {
        // stderr is a pipe exactly when there is a sink to drain it into.
        if (auto stderr_fd = child->take_stderr()) {
            spawn_stderr_reader(
                executor,
                asio::posix::stream_descriptor(executor, stderr_fd.release()),
                config_.log_sink,
                config_.space_id,
                config_.server_id
            );
        }

        transport = std::make_unique<ChildStdioTransport>(executor, std::move(*child), config_.stdio);
    } catch (const std::system_error& e) {
        co_return fail("Failed to spawn process: " + std::string(e.what()) + "." + hint());
    }

    // ─────────────────────────────────────────────────────────────────────
    // Handshake, raced against the connect deadline. The loser is
    // cancelled; a cancelled handshake destroys the transport, which kills
    // the child.
    // ─────────────────────────────────────────────────────────────────────
    transition(ConnectState::Handshaking);

    auto factory = config_.session_factory
        ? config_.session_factory
        : std::make_shared<McpSessionFactory>();

    HandshakeContext context{
        config_.space_id,
        config_.server_id,
        config_.log_sink,
        config_.event_sink
    };

    asio::steady_timer deadline(executor, config_.connect_timeout);
    std::variant<HandshakeResult, std::monostate> raced;
    try {
        raced = co_await (
            factory->async_handshake(std::move(transport), std::move(context)) ||
            deadline.async_wait(asio::use_awaitable)
        );
    } catch (const std::exception& e) {
        co_return fail("MCP handshake failed: " + std::string(e.what()) + "." + hint());
    }

    if (raced.index() == 1) {
        co_return fail("Connection timeout (" + format_duration(config_.connect_timeout) + ")." + hint());
    }

    auto& handshake = std::get<0>(raced);
    if (!handshake) {
        const auto& error = handshake.error();
        if (error.code == HandshakeError::Code::AuthorizationRequired) {
            transition(ConnectState::OAuthRequired);
            get_logger().info_fmt("[{}] Server requires authorization", config_.server_id);
            log_connection(LogLevel::Warn, "Server requires authorization: " + error.message);
            co_return OAuthRequired{config_.server_id, error.auth_data};
        }
        co_return fail("MCP handshake failed: " + error.message + "." + hint());
    }

    auto session = std::move(*handshake);
    transition(ConnectState::Connected);
    get_logger().info_fmt(
        "[{}] STDIO server connected ({} {})",
        config_.server_id,
        session->server_info().name,
        session->server_info().version
    );
    log_connection(LogLevel::Info, "Server connected successfully");
    publish(DomainEventKind::ServerConnected, Json{
        {"server_name", session->server_info().name},
        {"server_version", session->server_info().version}
    });
    co_return Connected{std::move(session)};
}

}  // namespace mcpmux
