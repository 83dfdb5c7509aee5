#include "mcpmux/session/mcp_session.hpp"
#include "mcpmux/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <unordered_map>
#include <variant>

namespace mcpmux {

using namespace asio::experimental::awaitable_operators;

namespace {

constexpr std::uint64_t kInitializeRequestId = 0;

using ResponseChannel = asio::experimental::channel<
    void(asio::error_code, SessionResult<Json>)
>;

// ─────────────────────────────────────────────────────────────────────────────
// JSON-RPC framing helpers
// ─────────────────────────────────────────────────────────────────────────────
// Request:      "method" and a non-null "id"
// Notification: "method" and no "id"
// Response:     "id" and no "method"

bool has_id(const Json& m) {
    return m.contains("id") && !m["id"].is_null();
}

bool is_request(const Json& m) {
    return m.contains("method") && has_id(m);
}

bool is_notification(const Json& m) {
    return m.contains("method") && !has_id(m);
}

std::optional<std::uint64_t> response_id(const Json& m) {
    if (!has_id(m)) {
        return std::nullopt;
    }
    const auto& id = m["id"];
    if (id.is_number_unsigned()) {
        return id.get<std::uint64_t>();
    }
    if (id.is_number_integer() && id.get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(id.get<std::int64_t>());
    }
    return std::nullopt;
}

Json make_request(std::uint64_t id, const std::string& method, const Json& params) {
    Json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.empty()) {
        request["params"] = params;
    }
    return request;
}

Json make_notification(const std::string& method, const Json& params) {
    Json notification = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.empty()) {
        notification["params"] = params;
    }
    return notification;
}

SessionResult<Json> extract_result(const Json& response) {
    if (response.contains("error")) {
        return tl::unexpected(SessionError::from_rpc_error(McpError::from_json(response["error"])));
    }
    if (response.contains("result")) {
        return response["result"];
    }
    return tl::unexpected(SessionError::protocol("Response missing 'result' field"));
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

HandshakeError handshake_error_from_rpc(const McpError& error) {
    const auto lower = to_lower(error.message);
    if (error.code == ErrorCode::Unauthorized
        || lower.find("unauthorized") != std::string::npos
        || lower.find("authorization required") != std::string::npos) {
        return HandshakeError::authorization_required(error.message, error.data.value_or(Json()));
    }
    return HandshakeError::rejected(error.message);
}

// ═══════════════════════════════════════════════════════════════════════════
// SessionCore - state shared by the session handle and its dispatcher
// ═══════════════════════════════════════════════════════════════════════════
// After the handshake every member is touched on strand_ only. Coroutines
// spawned onto the strand take `self` by value so the core outlives them.

class SessionCore {
public:
    SessionCore(
        std::unique_ptr<IAsyncTransport> transport,
        HandshakeContext context,
        McpSessionConfig config
    )
        : transport_(std::move(transport))
        , strand_(asio::make_strand(transport_->get_executor()))
        , context_(std::move(context))
        , config_(std::move(config))
    {}

    [[nodiscard]] asio::strand<asio::any_io_executor>& strand() { return strand_; }
    [[nodiscard]] bool is_open() const { return open_; }
    [[nodiscard]] const std::string& server_id() const { return context_.server_id; }

    /// initialize -> response -> notifications/initialized.
    /// Runs before the dispatcher exists, on the caller's executor.
    asio::awaitable<tl::expected<InitializeResult, HandshakeError>> initialize();

    static asio::awaitable<void> run(std::shared_ptr<SessionCore> self);
    static asio::awaitable<SessionResult<Json>> request(
        std::shared_ptr<SessionCore> self, std::string method, Json params);
    static asio::awaitable<SessionResult<void>> notify(
        std::shared_ptr<SessionCore> self, std::string method, Json params);
    static asio::awaitable<void> shutdown(std::shared_ptr<SessionCore> self);

private:
    asio::awaitable<void> route(const Json& message);
    asio::awaitable<void> handle_server_request(const Json& request);
    void handle_notification(const std::string& method, const Json& params);
    void publish(DomainEventKind kind);
    void fail_pending(const SessionError& error);

    std::unique_ptr<IAsyncTransport> transport_;
    asio::strand<asio::any_io_executor> strand_;
    HandshakeContext context_;
    McpSessionConfig config_;

    std::atomic<bool> open_{true};
    std::uint64_t next_id_{kInitializeRequestId};
    std::unordered_map<std::uint64_t, std::shared_ptr<ResponseChannel>> pending_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Handshake
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<tl::expected<InitializeResult, HandshakeError>> SessionCore::initialize() {
    InitializeParams params;
    params.client_info = {config_.client_name, config_.client_version};
    params.capabilities = config_.capabilities;

    auto sent = co_await transport_->async_send(
        make_request(kInitializeRequestId, Method::Initialize, params.to_json())
    );
    if (!sent) {
        co_return tl::unexpected(HandshakeError::transport(sent.error().message));
    }

    while (true) {
        auto message = co_await transport_->async_receive();
        if (!message) {
            co_return tl::unexpected(HandshakeError::transport(message.error().message));
        }
        const Json& m = *message;

        // Servers may log or ping before answering.
        if (is_request(m)) {
            co_await handle_server_request(m);
            continue;
        }
        if (is_notification(m)) {
            if (m["method"].is_string()) {
                handle_notification(m["method"].get<std::string>(), m.value("params", Json::object()));
            }
            continue;
        }

        auto id = response_id(m);
        if (!id || *id != kInitializeRequestId) {
            MCPMUX_LOG_WARN("Ignoring unexpected message during handshake with " + context_.server_id);
            continue;
        }

        if (m.contains("error")) {
            co_return tl::unexpected(handshake_error_from_rpc(McpError::from_json(m["error"])));
        }
        if (!m.contains("result") || !m["result"].is_object()) {
            co_return tl::unexpected(HandshakeError::protocol("initialize response missing 'result'"));
        }

        InitializeResult result;
        try {
            result = InitializeResult::from_json(m["result"]);
        } catch (const Json::exception& e) {
            co_return tl::unexpected(HandshakeError::protocol(
                "Invalid initialize result: " + std::string(e.what())
            ));
        }

        auto notified = co_await transport_->async_send(
            make_notification(Method::Initialized, Json::object())
        );
        if (!notified) {
            co_return tl::unexpected(HandshakeError::transport(notified.error().message));
        }

        get_logger().debug_fmt(
            "Session initialized with {} {} (protocol {})",
            result.server_info.name,
            result.server_info.version,
            result.protocol_version
        );
        co_return result;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Dispatcher
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<void> SessionCore::run(std::shared_ptr<SessionCore> self) {
    while (self->open_) {
        auto message = co_await self->transport_->async_receive();
        if (!message) {
            if (self->open_.exchange(false)) {
                MCPMUX_LOG_DEBUG("Session with " + self->server_id() + " ended: "
                                 + message.error().message);
                self->fail_pending(SessionError::transport(message.error().message));
            }
            break;
        }
        bool malformed = false;
        try {
            co_await self->route(*message);
        } catch (const Json::exception& e) {
            MCPMUX_LOG_WARN("Malformed message from " + self->server_id() + ": " + e.what());
            malformed = true;
        }
        if (malformed && self->open_.exchange(false)) {
            self->fail_pending(SessionError::protocol("Malformed message from server"));
            co_await self->transport_->async_stop();
            break;
        }
    }
}

asio::awaitable<void> SessionCore::route(const Json& message) {
    if (is_request(message)) {
        co_await handle_server_request(message);
        co_return;
    }

    if (is_notification(message)) {
        if (message["method"].is_string()) {
            handle_notification(
                message["method"].get<std::string>(),
                message.value("params", Json::object())
            );
        }
        co_return;
    }

    auto id = response_id(message);
    if (!id) {
        MCPMUX_LOG_WARN("Received response with non-integer ID, ignoring");
        co_return;
    }

    auto it = pending_.find(*id);
    if (it == pending_.end()) {
        MCPMUX_LOG_WARN("Received response for unknown request ID: " + std::to_string(*id));
        co_return;
    }
    it->second->try_send(asio::error_code{}, extract_result(message));
    pending_.erase(it);
}

asio::awaitable<void> SessionCore::handle_server_request(const Json& request) {
    const std::string method = request["method"].is_string()
        ? request["method"].get<std::string>()
        : std::string();

    Json response = {
        {"jsonrpc", "2.0"},
        {"id", request["id"]}
    };
    if (method == Method::Ping) {
        response["result"] = Json::object();
    } else {
        MCPMUX_LOG_DEBUG("Rejecting server request: " + method);
        response["error"] = {
            {"code", ErrorCode::MethodNotFound},
            {"message", "Method not found: " + method}
        };
    }

    auto sent = co_await transport_->async_send(std::move(response));
    if (!sent) {
        MCPMUX_LOG_DEBUG("Failed to answer server request: " + sent.error().message);
    }
}

void SessionCore::publish(DomainEventKind kind) {
    if (context_.event_sink) {
        context_.event_sink->publish(DomainEvent{kind, context_.space_id, context_.server_id});
    }
}

void SessionCore::handle_notification(const std::string& method, const Json& params) {
    if (method == Method::ToolsListChanged) {
        publish(DomainEventKind::ToolsListChanged);
    } else if (method == Method::ResourcesListChanged) {
        publish(DomainEventKind::ResourcesListChanged);
    } else if (method == Method::PromptsListChanged) {
        publish(DomainEventKind::PromptsListChanged);
    } else if (method == Method::LoggingMessage) {
        if (!context_.log_sink || !params.is_object()) {
            return;
        }
        try {
            const auto note = LoggingMessageNotification::from_json(params);
            ServerLog entry(log_level_from_mcp(note.level), LogSource::Server, note.text());
            auto appended = context_.log_sink->append(context_.space_id, context_.server_id, entry);
            if (!appended) {
                MCPMUX_LOG_TRACE("Dropped server log message: " + appended.error().message);
            }
        } catch (const Json::exception& e) {
            MCPMUX_LOG_DEBUG("Malformed logging notification: " + std::string(e.what()));
        }
    } else {
        MCPMUX_LOG_TRACE("Ignoring notification " + method + " from " + context_.server_id);
    }
}

void SessionCore::fail_pending(const SessionError& error) {
    for (auto& [id, channel] : pending_) {
        channel->try_send(asio::error_code{}, tl::unexpected(error));
    }
    pending_.clear();
}

// ─────────────────────────────────────────────────────────────────────────────
// Outgoing
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<SessionResult<Json>> SessionCore::request(
    std::shared_ptr<SessionCore> self,
    std::string method,
    Json params
) {
    if (!self->open_) {
        co_return tl::unexpected(SessionError::not_connected());
    }

    const std::uint64_t id = ++self->next_id_;
    auto channel = std::make_shared<ResponseChannel>(self->strand_, 1);
    self->pending_[id] = channel;

    auto sent = co_await self->transport_->async_send(make_request(id, method, params));
    if (!sent) {
        self->pending_.erase(id);
        co_return tl::unexpected(SessionError::transport(sent.error().message));
    }

    try {
        if (self->config_.request_timeout.count() <= 0) {
            co_return co_await channel->async_receive(asio::use_awaitable);
        }

        asio::steady_timer timer(self->strand_, self->config_.request_timeout);
        auto outcome = co_await (
            channel->async_receive(asio::use_awaitable) ||
            timer.async_wait(asio::use_awaitable)
        );
        if (outcome.index() == 1) {
            self->pending_.erase(id);
            co_return tl::unexpected(SessionError::timeout("Request timed out: " + method));
        }
        co_return std::get<0>(std::move(outcome));
    } catch (const std::system_error& e) {
        self->pending_.erase(id);
        co_return tl::unexpected(SessionError::transport(e.what()));
    }
}

asio::awaitable<SessionResult<void>> SessionCore::notify(
    std::shared_ptr<SessionCore> self,
    std::string method,
    Json params
) {
    if (!self->open_) {
        co_return tl::unexpected(SessionError::not_connected());
    }
    auto sent = co_await self->transport_->async_send(make_notification(method, params));
    if (!sent) {
        co_return tl::unexpected(SessionError::transport(sent.error().message));
    }
    co_return SessionResult<void>{};
}

asio::awaitable<void> SessionCore::shutdown(std::shared_ptr<SessionCore> self) {
    if (!self->open_.exchange(false)) {
        co_return;
    }
    self->fail_pending(SessionError::not_connected());
    co_await self->transport_->async_stop();
    MCPMUX_LOG_DEBUG("Session with " + self->server_id() + " closed");
}

// ═══════════════════════════════════════════════════════════════════════════
// McpSession - the handle callers hold
// ═══════════════════════════════════════════════════════════════════════════

class McpSession final : public IMcpSession {
public:
    McpSession(std::shared_ptr<SessionCore> core, InitializeResult init)
        : core_(std::move(core))
        , init_(std::move(init))
    {}

    ~McpSession() override {
        // The dispatcher keeps the core alive while it waits on the
        // transport; stopping the transport is what lets it finish.
        if (core_->is_open()) {
            asio::co_spawn(core_->strand(), SessionCore::shutdown(core_), asio::detached);
        }
    }

    McpSession(const McpSession&) = delete;
    McpSession& operator=(const McpSession&) = delete;

    [[nodiscard]] const InitializeResult& initialize_result() const override {
        return init_;
    }

    [[nodiscard]] asio::awaitable<SessionResult<Json>> send_request(
        std::string method,
        Json params
    ) override {
        co_return co_await asio::co_spawn(
            core_->strand(),
            SessionCore::request(core_, std::move(method), std::move(params)),
            asio::use_awaitable
        );
    }

    [[nodiscard]] asio::awaitable<SessionResult<void>> send_notification(
        std::string method,
        Json params
    ) override {
        co_return co_await asio::co_spawn(
            core_->strand(),
            SessionCore::notify(core_, std::move(method), std::move(params)),
            asio::use_awaitable
        );
    }

    [[nodiscard]] asio::awaitable<void> close() override {
        co_await asio::co_spawn(core_->strand(), SessionCore::shutdown(core_), asio::use_awaitable);
    }

    [[nodiscard]] bool is_open() const override {
        return core_->is_open();
    }

private:
    std::shared_ptr<SessionCore> core_;
    InitializeResult init_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// McpSessionFactory
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<HandshakeResult> McpSessionFactory::async_handshake(
    std::unique_ptr<IAsyncTransport> transport,
    HandshakeContext context
) {
    if (!transport) {
        co_return tl::unexpected(HandshakeError::transport("No transport"));
    }

    auto core = std::make_shared<SessionCore>(std::move(transport), std::move(context), config_);

    auto initialized = co_await core->initialize();
    if (!initialized) {
        co_return tl::unexpected(std::move(initialized.error()));
    }

    std::shared_ptr<IMcpSession> session =
        std::make_shared<McpSession>(core, std::move(*initialized));
    asio::co_spawn(core->strand(), SessionCore::run(core), asio::detached);
    co_return session;
}

LogLevel log_level_from_mcp(std::string_view level) noexcept {
    if (level == "debug") {
        return LogLevel::Debug;
    }
    if (level == "info" || level == "notice") {
        return LogLevel::Info;
    }
    if (level == "warning") {
        return LogLevel::Warn;
    }
    if (level == "error" || level == "critical" || level == "alert" || level == "emergency") {
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

}  // namespace mcpmux
