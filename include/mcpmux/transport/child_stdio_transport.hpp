#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Child Stdio Transport
// ═══════════════════════════════════════════════════════════════════════════
// Newline-delimited JSON-RPC over the stdin/stdout pipes of a spawned child.
// Owns the ChildProcess: destroying the transport kills the child (and its
// process group) if it is still running.

#include "mcpmux/transport/async_transport.hpp"
#include "mcpmux/process/child_process.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <atomic>
#include <chrono>
#include <string>

namespace mcpmux {

struct ChildStdioConfig {
    /// Longer lines are rejected as a protocol error
    std::size_t max_message_size{4 * 1024 * 1024};

    /// SIGTERM grace period in async_stop() before SIGKILL
    std::chrono::milliseconds shutdown_timeout{std::chrono::seconds(2)};
};

class ChildStdioTransport final : public IAsyncTransport {
public:
    /// Takes the child's stdin/stdout; both must have been spawned as pipes.
    ChildStdioTransport(
        asio::any_io_executor executor,
        ChildProcess child,
        ChildStdioConfig config = {}
    );
    ~ChildStdioTransport() override;

    ChildStdioTransport(const ChildStdioTransport&) = delete;
    ChildStdioTransport& operator=(const ChildStdioTransport&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;

    [[nodiscard]] pid_t child_pid() const noexcept { return child_.pid(); }

    /// Exit code once the child has been reaped
    [[nodiscard]] std::optional<int> exit_code() { return child_.try_wait(); }

private:
    void close_streams();

    asio::any_io_executor executor_;
    ChildProcess child_;
    ChildStdioConfig config_;

    asio::posix::stream_descriptor stdin_stream_;
    asio::posix::stream_descriptor stdout_stream_;

    // Capacity-one channel used as an async mutex: a message is written
    // whole before the next one starts.
    asio::experimental::channel<void(asio::error_code)> write_gate_;

    std::atomic<bool> running_{false};

    // Bytes past the last newline from the previous read
    std::string read_buffer_;
};

}  // namespace mcpmux
