// ─────────────────────────────────────────────────────────────────────────────
// Stderr Pipeline Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpmux/diagnostics/stderr_pipeline.hpp"
#include "mcpmux/process/child_process.hpp"

#include "support/memory_log_sink.hpp"
#include "support/run_sync.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <string>

using namespace mcpmux;
using namespace mcpmux::test;
using namespace std::chrono_literals;

namespace {

/// Spawn `sh -c script` with only stderr piped and drain it into `sink`
void drain_stderr_of(const std::string& script, const std::shared_ptr<MemoryLogSink>& sink) {
    ChildSpec spec;
    spec.program = "/bin/sh";
    spec.args = {"-c", script};
    spec.stdin_mode = StdioMode::Null;
    spec.stdout_mode = StdioMode::Null;
    spec.stderr_mode = StdioMode::Pipe;
    spec.kill_on_drop = true;

    auto child = ChildProcess::spawn(spec);
    REQUIRE(child.has_value());

    asio::io_context io;
    asio::posix::stream_descriptor stream(io, child->take_stderr().release());
    run_sync(io, read_stderr_lines(std::move(stream), sink, "space-1", "server-1"));

    REQUIRE(child->wait_with_output(5s).success());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Classification
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("classify_stderr_line maps keywords to levels", "[stderr][classify]") {
    REQUIRE(classify_stderr_line("Error: connection refused") == LogLevel::Error);
    REQUIRE(classify_stderr_line("thread 'main' panicked at src/main.rs") == LogLevel::Error);
    REQUIRE(classify_stderr_line("FATAL: out of memory") == LogLevel::Error);
    REQUIRE(classify_stderr_line("WARNING: deprecated option") == LogLevel::Warn);
    REQUIRE(classify_stderr_line("[DEBUG] loaded 3 tools") == LogLevel::Debug);
    REQUIRE(classify_stderr_line("trace: request received") == LogLevel::Debug);
    REQUIRE(classify_stderr_line("Server running on stdio") == LogLevel::Info);
    REQUIRE(classify_stderr_line("") == LogLevel::Info);
}

TEST_CASE("classify_stderr_line prefers the most severe keyword", "[stderr][classify]") {
    REQUIRE(classify_stderr_line("warn: retrying after error") == LogLevel::Error);
    REQUIRE(classify_stderr_line("debug: about to warn") == LogLevel::Warn);
}

TEST_CASE("classify_stderr_line matches substrings", "[stderr][classify]") {
    REQUIRE(classify_stderr_line("ValueErrorException") == LogLevel::Error);
    REQUIRE(classify_stderr_line("Stacktrace follows") == LogLevel::Debug);
}

// ═══════════════════════════════════════════════════════════════════════════
// Reader
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Stderr lines reach the sink in order", "[stderr][reader]") {
    auto sink = std::make_shared<MemoryLogSink>();

    drain_stderr_of("echo 'Starting server' >&2; echo 'warning: slow disk' >&2; "
                    "echo 'Error: bad token' >&2", sink);

    const auto entries = sink->entries();
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].space_id == "space-1");
    REQUIRE(entries[0].server_id == "server-1");

    REQUIRE(entries[0].log.source == LogSource::Stderr);
    REQUIRE(entries[0].log.message == "Starting server");
    REQUIRE(entries[0].log.level == LogLevel::Info);
    REQUIRE(entries[1].log.level == LogLevel::Warn);
    REQUIRE(entries[2].log.message == "Error: bad token");
    REQUIRE(entries[2].log.level == LogLevel::Error);
}

TEST_CASE("Stderr reader skips empty lines and strips carriage returns", "[stderr][reader]") {
    auto sink = std::make_shared<MemoryLogSink>();

    drain_stderr_of("printf 'first\\r\\n\\n\\r\\nsecond\\n' >&2", sink);

    const auto logs = sink->from(LogSource::Stderr);
    REQUIRE(logs.size() == 2);
    REQUIRE(logs[0].message == "first");
    REQUIRE(logs[1].message == "second");
}

TEST_CASE("Stderr reader forwards a final line without newline", "[stderr][reader]") {
    auto sink = std::make_shared<MemoryLogSink>();

    drain_stderr_of("printf 'one\\ntwo' >&2", sink);

    const auto logs = sink->from(LogSource::Stderr);
    REQUIRE(logs.size() == 2);
    REQUIRE(logs[1].message == "two");
}

TEST_CASE("Stderr reader splits overlong lines", "[stderr][reader]") {
    auto sink = std::make_shared<MemoryLogSink>();

    drain_stderr_of("head -c 70000 /dev/zero | tr '\\000' 'a' >&2; echo >&2", sink);

    const auto logs = sink->from(LogSource::Stderr);
    REQUIRE(logs.size() == 2);
    REQUIRE(logs[0].message.size() == kMaxStderrLineBytes);
    REQUIRE(logs[0].message.size() + logs[1].message.size() == 70000);
}

TEST_CASE("Stderr reader keeps going when the sink fails", "[stderr][reader]") {
    auto sink = std::make_shared<MemoryLogSink>();
    sink->set_failing(true);

    drain_stderr_of("echo 'lost' >&2; echo 'also lost' >&2", sink);

    REQUIRE(sink->entries().empty());
}

TEST_CASE("spawn_stderr_reader needs a sink", "[stderr][reader]") {
    asio::io_context io;
    asio::posix::stream_descriptor stream(io);

    REQUIRE_FALSE(spawn_stderr_reader(io.get_executor(), std::move(stream), nullptr, "s", "id"));
}

TEST_CASE("spawn_stderr_reader runs in the background", "[stderr][reader]") {
    auto sink = std::make_shared<MemoryLogSink>();

    ChildSpec spec;
    spec.program = "/bin/sh";
    spec.args = {"-c", "echo 'background line' >&2"};
    spec.stdin_mode = StdioMode::Null;
    spec.stdout_mode = StdioMode::Null;
    spec.stderr_mode = StdioMode::Pipe;
    spec.kill_on_drop = true;

    auto child = ChildProcess::spawn(spec);
    REQUIRE(child.has_value());

    asio::io_context io;
    REQUIRE(spawn_stderr_reader(
        io.get_executor(),
        asio::posix::stream_descriptor(io, child->take_stderr().release()),
        sink,
        "space-1",
        "server-1"
    ));

    // Returns once the reader hits EOF and no work is left
    io.run_for(5s);

    REQUIRE(sink->contains(LogSource::Stderr, "background line"));
}
