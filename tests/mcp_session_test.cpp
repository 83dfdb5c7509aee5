// ─────────────────────────────────────────────────────────────────────────────
// MCP Session Tests
// ─────────────────────────────────────────────────────────────────────────────
// Handshake and routing against scripted servers over a real child process.

#include <catch2/catch_test_macros.hpp>

#include "mcpmux/process/child_process.hpp"
#include "mcpmux/session/mcp_session.hpp"
#include "mcpmux/transport/child_stdio_transport.hpp"

#include "support/event_recorder.hpp"
#include "support/fake_server.hpp"
#include "support/memory_log_sink.hpp"
#include "support/run_sync.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <memory>

using namespace mcpmux;
using namespace mcpmux::test;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<IAsyncTransport> launch(asio::io_context& io, const std::filesystem::path& script) {
    ChildSpec spec;
    spec.program = script.string();
    spec.stdin_mode = StdioMode::Pipe;
    spec.stdout_mode = StdioMode::Pipe;
    spec.stderr_mode = StdioMode::Null;
    spec.new_process_group = true;
    spec.kill_on_drop = true;

    auto child = ChildProcess::spawn(spec);
    REQUIRE(child.has_value());
    return std::make_unique<ChildStdioTransport>(io.get_executor(), std::move(*child));
}

HandshakeContext context_for(
    std::shared_ptr<IServerLogSink> sink = nullptr,
    std::shared_ptr<IEventSink> events = nullptr
) {
    return HandshakeContext{"space-1", "fake", std::move(sink), std::move(events)};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Handshake yields server info and capabilities", "[session][handshake]") {
    asio::io_context io;
    const auto script = write_fake_server("mcpmux_session_ok", {});

    McpSessionFactory factory;
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));

    REQUIRE(result.has_value());
    auto session = *result;
    REQUIRE(session->is_open());
    REQUIRE(session->server_info().name == "fake-server");
    REQUIRE(session->server_info().version == "1.2.3");
    REQUIRE(session->initialize_result().protocol_version == MCP_PROTOCOL_VERSION);
    REQUIRE(session->capabilities().tools.has_value());

    run_sync(io, session->close());
    REQUIRE_FALSE(session->is_open());

    std::filesystem::remove(script);
}

TEST_CASE("Handshake reports a server error as rejected", "[session][handshake]") {
    asio::io_context io;
    FakeServerScript script_def;
    script_def.initialize_reply =
        R"({"jsonrpc":"2.0","id":0,"error":{"code":-32602,"message":"Unsupported protocol version"}})";
    const auto script = write_fake_server("mcpmux_session_rejected", script_def);

    McpSessionFactory factory;
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == HandshakeError::Code::Rejected);
    REQUIRE(result.error().message.find("Unsupported protocol version") != std::string::npos);

    std::filesystem::remove(script);
}

TEST_CASE("Handshake detects authorization errors", "[session][handshake][auth]") {
    asio::io_context io;

    SECTION("by error code") {
        FakeServerScript script_def;
        script_def.initialize_reply =
            R"({"jsonrpc":"2.0","id":0,"error":{"code":-32001,"message":"Login needed","data":{"url":"https://example.test/auth"}}})";
        const auto script = write_fake_server("mcpmux_session_auth_code", script_def);

        McpSessionFactory factory;
        auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == HandshakeError::Code::AuthorizationRequired);
        REQUIRE(result.error().auth_data["url"] == "https://example.test/auth");

        std::filesystem::remove(script);
    }

    SECTION("by message") {
        FakeServerScript script_def;
        script_def.initialize_reply =
            R"({"jsonrpc":"2.0","id":0,"error":{"code":-32603,"message":"Unauthorized: token expired"}})";
        const auto script = write_fake_server("mcpmux_session_auth_msg", script_def);

        McpSessionFactory factory;
        auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == HandshakeError::Code::AuthorizationRequired);

        std::filesystem::remove(script);
    }
}

TEST_CASE("Handshake fails when the server exits", "[session][handshake]") {
    asio::io_context io;
    FakeServerScript script_def;
    script_def.preamble = "exit 1";
    const auto script = write_fake_server("mcpmux_session_exit", script_def);

    McpSessionFactory factory;
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == HandshakeError::Code::Transport);

    std::filesystem::remove(script);
}

TEST_CASE("Handshake rejects a reply without result", "[session][handshake]") {
    asio::io_context io;
    FakeServerScript script_def;
    script_def.initialize_reply = R"({"jsonrpc":"2.0","id":0})";
    const auto script = write_fake_server("mcpmux_session_noresult", script_def);

    McpSessionFactory factory;
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == HandshakeError::Code::Protocol);

    std::filesystem::remove(script);
}

// ═══════════════════════════════════════════════════════════════════════════
// Server-initiated traffic
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Session answers server pings", "[session][routing]") {
    asio::io_context io;
    FakeServerScript script_def;
    script_def.before_reply = {R"({"jsonrpc":"2.0","id":"srv-ping","method":"ping"})"};
    const auto script = write_fake_server("mcpmux_session_ping", script_def);

    McpSessionFactory factory;
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));
    REQUIRE(result.has_value());
    auto session = *result;

    auto tools = run_sync(io, session->send_request("tools/list"));

    REQUIRE(tools.has_value());
    REQUIRE((*tools)["pong"] == "yes");

    run_sync(io, session->close());
    std::filesystem::remove(script);
}

TEST_CASE("Session publishes list_changed notifications", "[session][routing]") {
    asio::io_context io;
    FakeServerScript script_def;
    script_def.after_initialized = {
        R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})",
        R"({"jsonrpc":"2.0","method":"notifications/prompts/list_changed"})"
    };
    const auto script = write_fake_server("mcpmux_session_events", script_def);
    auto recorder = std::make_shared<EventRecorder>();

    McpSessionFactory factory;
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for(nullptr, recorder)));
    REQUIRE(result.has_value());
    auto session = *result;

    // The notifications precede this reply on the wire
    REQUIRE(run_sync(io, session->send_request("tools/list")).has_value());

    const auto events = recorder->events();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].kind == DomainEventKind::ToolsListChanged);
    REQUIRE(events[0].server_id == "fake");
    REQUIRE(events[0].space_id == "space-1");
    REQUIRE(events[1].kind == DomainEventKind::PromptsListChanged);

    run_sync(io, session->close());
    std::filesystem::remove(script);
}

TEST_CASE("Session forwards server log messages", "[session][routing]") {
    asio::io_context io;
    FakeServerScript script_def;
    script_def.before_reply = {
        R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info","data":"booting"}})"
    };
    script_def.after_initialized = {
        R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"warning","logger":"db","data":"pool exhausted"}})"
    };
    const auto script = write_fake_server("mcpmux_session_logs", script_def);
    auto sink = std::make_shared<MemoryLogSink>();

    McpSessionFactory factory;
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for(sink)));
    REQUIRE(result.has_value());
    auto session = *result;
    REQUIRE(run_sync(io, session->send_request("tools/list")).has_value());

    const auto logs = sink->from(LogSource::Server);
    REQUIRE(logs.size() == 2);
    REQUIRE(logs[0].message == "booting");
    REQUIRE(logs[0].level == LogLevel::Info);
    REQUIRE(logs[1].message == "[db] pool exhausted");
    REQUIRE(logs[1].level == LogLevel::Warn);

    run_sync(io, session->close());
    std::filesystem::remove(script);
}

// ═══════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Requests on a closed session fail", "[session]") {
    asio::io_context io;
    const auto script = write_fake_server("mcpmux_session_closed", {});

    McpSessionFactory factory;
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));
    REQUIRE(result.has_value());
    auto session = *result;

    run_sync(io, session->close());
    auto tools = run_sync(io, session->send_request("tools/list"));

    REQUIRE_FALSE(tools.has_value());
    REQUIRE(tools.error().code == SessionError::Code::NotConnected);

    std::filesystem::remove(script);
}

TEST_CASE("Requests time out when the server never answers", "[session][timeout]") {
    asio::io_context io;
    const auto script = write_fake_server("mcpmux_session_slow", {});

    McpSessionConfig config;
    config.request_timeout = 200ms;
    McpSessionFactory factory(config);
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));
    REQUIRE(result.has_value());
    auto session = *result;

    auto reply = run_sync(io, session->send_request("resources/list"));

    REQUIRE_FALSE(reply.has_value());
    REQUIRE(reply.error().code == SessionError::Code::Timeout);

    run_sync(io, session->close());
    std::filesystem::remove(script);
}

TEST_CASE("Malformed error replies fail the request and keep the session", "[session][routing]") {
    asio::io_context io;
    FakeServerScript script_def;
    script_def.tools_list_reply = R"({"jsonrpc":"2.0","id":%s,"error":"nope"})";
    const auto script = write_fake_server("mcpmux_session_bad_error", script_def);

    McpSessionConfig config;
    config.request_timeout = 5s;
    McpSessionFactory factory(config);
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));
    REQUIRE(result.has_value());
    auto session = *result;

    auto first = run_sync(io, session->send_request("tools/list"));
    REQUIRE_FALSE(first.has_value());
    REQUIRE(first.error().code == SessionError::Code::Rpc);
    REQUIRE(first.error().message == "nope");
    REQUIRE(session->is_open());

    auto second = run_sync(io, session->send_request("tools/list"));
    REQUIRE_FALSE(second.has_value());
    REQUIRE(second.error().code == SessionError::Code::Rpc);

    run_sync(io, session->close());
    std::filesystem::remove(script);
}

TEST_CASE("McpError::from_json tolerates malformed errors", "[session][protocol]") {
    SECTION("string error") {
        auto err = McpError::from_json(Json("nope"));
        REQUIRE(err.code == 0);
        REQUIRE(err.message == "nope");
        REQUIRE_FALSE(err.data.has_value());
    }

    SECTION("non-string, non-object error") {
        auto err = McpError::from_json(Json::array({1, 2}));
        REQUIRE(err.code == 0);
        REQUIRE(err.message == "[1,2]");
    }

    SECTION("mistyped fields") {
        auto err = McpError::from_json(Json{{"code", "x"}, {"message", 42}, {"data", "extra"}});
        REQUIRE(err.code == 0);
        REQUIRE(err.message.empty());
        REQUIRE(err.data == Json("extra"));
    }

    SECTION("well-formed error") {
        auto err = McpError::from_json(Json{{"code", -32601}, {"message", "Method not found"}});
        REQUIRE(err.code == ErrorCode::MethodNotFound);
        REQUIRE(err.message == "Method not found");
    }
}

TEST_CASE("Handshake rejects a malformed error reply without throwing", "[session][handshake]") {
    asio::io_context io;
    FakeServerScript script_def;
    script_def.initialize_reply = R"({"jsonrpc":"2.0","id":0,"error":{"code":"x","message":"boom"}})";
    const auto script = write_fake_server("mcpmux_session_bad_init_error", script_def);

    McpSessionFactory factory;
    auto result = run_sync(io, factory.async_handshake(launch(io, script), context_for()));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == HandshakeError::Code::Rejected);
    REQUIRE(result.error().message == "boom");

    std::filesystem::remove(script);
}

TEST_CASE("log_level_from_mcp maps syslog levels", "[session]") {
    REQUIRE(log_level_from_mcp("debug") == LogLevel::Debug);
    REQUIRE(log_level_from_mcp("info") == LogLevel::Info);
    REQUIRE(log_level_from_mcp("notice") == LogLevel::Info);
    REQUIRE(log_level_from_mcp("warning") == LogLevel::Warn);
    REQUIRE(log_level_from_mcp("error") == LogLevel::Error);
    REQUIRE(log_level_from_mcp("critical") == LogLevel::Error);
    REQUIRE(log_level_from_mcp("emergency") == LogLevel::Error);
    REQUIRE(log_level_from_mcp("bogus") == LogLevel::Info);
}
