#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Session
// ═══════════════════════════════════════════════════════════════════════════
// A handshaked MCP session over any IAsyncTransport. The connection
// orchestrator only knows ISessionFactory; McpSessionFactory is the default.
//
// Server-initiated traffic is routed without user handlers:
//   ping                          -> answered
//   other requests                -> MethodNotFound
//   notifications/*/list_changed  -> IEventSink
//   notifications/message         -> IServerLogSink (source Server)

#include "mcpmux/events/domain_event.hpp"
#include "mcpmux/log/server_log.hpp"
#include "mcpmux/protocol/mcp_types.hpp"
#include "mcpmux/transport/async_transport.hpp"

#include <asio/awaitable.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace mcpmux {

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

struct SessionError {
    enum class Code { NotConnected, Transport, Timeout, Rpc, Protocol };

    Code code;
    std::string message;
    std::optional<McpError> rpc_error;

    static SessionError not_connected() {
        return {Code::NotConnected, "Session is closed", std::nullopt};
    }

    static SessionError transport(std::string msg) {
        return {Code::Transport, std::move(msg), std::nullopt};
    }

    static SessionError timeout(std::string msg = "Request timed out") {
        return {Code::Timeout, std::move(msg), std::nullopt};
    }

    static SessionError protocol(std::string msg) {
        return {Code::Protocol, std::move(msg), std::nullopt};
    }

    static SessionError from_rpc_error(const McpError& err) {
        return {Code::Rpc, err.message, err};
    }
};

template <typename T>
using SessionResult = tl::expected<T, SessionError>;

struct HandshakeError {
    enum class Code {
        Transport,              // Stream closed or unreadable during the exchange
        Protocol,               // Malformed reply
        Rejected,               // Server answered initialize with an error
        AuthorizationRequired   // Server wants the user to authorize first
    };

    Code code;
    std::string message;
    Json auth_data;

    static HandshakeError transport(std::string msg) {
        return {Code::Transport, std::move(msg), Json()};
    }

    static HandshakeError protocol(std::string msg) {
        return {Code::Protocol, std::move(msg), Json()};
    }

    static HandshakeError rejected(std::string msg) {
        return {Code::Rejected, std::move(msg), Json()};
    }

    static HandshakeError authorization_required(std::string msg, Json data = Json()) {
        return {Code::AuthorizationRequired, std::move(msg), std::move(data)};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Session Interface
// ═══════════════════════════════════════════════════════════════════════════

class IMcpSession {
public:
    virtual ~IMcpSession() = default;

    [[nodiscard]] virtual const InitializeResult& initialize_result() const = 0;

    [[nodiscard]] const Implementation& server_info() const {
        return initialize_result().server_info;
    }

    [[nodiscard]] const ServerCapabilities& capabilities() const {
        return initialize_result().capabilities;
    }

    [[nodiscard]] virtual asio::awaitable<SessionResult<Json>> send_request(
        std::string method,
        Json params = Json::object()
    ) = 0;

    [[nodiscard]] virtual asio::awaitable<SessionResult<void>> send_notification(
        std::string method,
        Json params = Json::object()
    ) = 0;

    /// Fail pending requests and stop the transport
    [[nodiscard]] virtual asio::awaitable<void> close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

using HandshakeResult = tl::expected<std::shared_ptr<IMcpSession>, HandshakeError>;

/// Who the session belongs to and where its side traffic goes
struct HandshakeContext {
    std::string space_id;
    std::string server_id;
    std::shared_ptr<IServerLogSink> log_sink;
    std::shared_ptr<IEventSink> event_sink;
};

class ISessionFactory {
public:
    virtual ~ISessionFactory() = default;

    /// Run the protocol handshake over `transport`. On success the session
    /// owns the transport; on failure or cancellation it is destroyed.
    [[nodiscard]] virtual asio::awaitable<HandshakeResult> async_handshake(
        std::unique_ptr<IAsyncTransport> transport,
        HandshakeContext context
    ) = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Default implementation
// ═══════════════════════════════════════════════════════════════════════════

struct McpSessionConfig {
    std::string client_name = "mcpmux";
    std::string client_version = "0.1.0";
    ClientCapabilities capabilities;

    /// Per request made through send_request(); 0 disables
    std::chrono::milliseconds request_timeout{std::chrono::seconds(60)};
};

class McpSessionFactory final : public ISessionFactory {
public:
    explicit McpSessionFactory(McpSessionConfig config = {})
        : config_(std::move(config))
    {}

    [[nodiscard]] asio::awaitable<HandshakeResult> async_handshake(
        std::unique_ptr<IAsyncTransport> transport,
        HandshakeContext context
    ) override;

private:
    McpSessionConfig config_;
};

/// Map an MCP (syslog-style) logging level onto ours
[[nodiscard]] LogLevel log_level_from_mcp(std::string_view level) noexcept;

}  // namespace mcpmux
