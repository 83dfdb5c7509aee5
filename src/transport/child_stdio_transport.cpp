#include "mcpmux/transport/child_stdio_transport.hpp"
#include "mcpmux/log/logger.hpp"

#include <asio/read_until.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <mutex>

#include <signal.h>

namespace mcpmux {

namespace {

// A write to a server that already exited must come back as EPIPE instead
// of terminating the gateway.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

ChildStdioTransport::ChildStdioTransport(
    asio::any_io_executor executor,
    ChildProcess child,
    ChildStdioConfig config
)
    : executor_(std::move(executor))
    , child_(std::move(child))
    , config_(config)
    , stdin_stream_(executor_)
    , stdout_stream_(executor_)
    , write_gate_(executor_, 1)
{
    ignore_sigpipe();
    read_buffer_.reserve(4096);

    auto in = child_.take_stdin();
    auto out = child_.take_stdout();
    if (in && out) {
        stdin_stream_.assign(in.release());
        stdout_stream_.assign(out.release());
        running_ = true;
    } else {
        MCPMUX_LOG_WARN("ChildStdioTransport created without stdin/stdout pipes (pid "
                        + std::to_string(child_.pid()) + ")");
    }
}

ChildStdioTransport::~ChildStdioTransport() {
    // Can't co_await here; kill outright rather than wait out a grace period.
    running_ = false;
    close_streams();
    child_.terminate(std::chrono::milliseconds(0));
}

void ChildStdioTransport::close_streams() {
    asio::error_code ec;
    if (stdin_stream_.is_open()) {
        stdin_stream_.close(ec);
    }
    if (stdout_stream_.is_open()) {
        stdout_stream_.close(ec);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// IAsyncTransport Interface
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor ChildStdioTransport::get_executor() {
    return executor_;
}

bool ChildStdioTransport::is_running() const {
    return running_;
}

asio::awaitable<void> ChildStdioTransport::async_stop() {
    if (!running_.exchange(false)) {
        co_return;
    }

    // Closing stdin is the polite shutdown request for stdio servers.
    write_gate_.cancel();
    close_streams();
    child_.terminate(config_.shutdown_timeout);

    MCPMUX_LOG_DEBUG("ChildStdioTransport stopped (pid " + std::to_string(child_.pid()) + ")");
}

asio::awaitable<TransportResult<void>> ChildStdioTransport::async_send(Json message) {
    if (!running_) {
        co_return tl::unexpected(TransportError::closed());
    }

    std::string data = message.dump(-1, ' ', false, Json::error_handler_t::replace);
    data.push_back('\n');

    asio::error_code ec;
    co_await write_gate_.async_send(asio::error_code{}, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return tl::unexpected(TransportError::closed());
    }

    co_await asio::async_write(
        stdin_stream_,
        asio::buffer(data),
        asio::redirect_error(asio::use_awaitable, ec)
    );
    write_gate_.try_receive([](asio::error_code) {});

    if (ec) {
        co_return tl::unexpected(TransportError::network("Write failed: " + ec.message()));
    }
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<Json>> ChildStdioTransport::async_receive() {
    while (true) {
        if (!running_) {
            co_return tl::unexpected(TransportError::closed());
        }

        std::size_t n = 0;
        try {
            n = co_await asio::async_read_until(
                stdout_stream_,
                asio::dynamic_buffer(read_buffer_, config_.max_message_size + 1),
                '\n',
                asio::use_awaitable
            );
        } catch (const std::system_error& e) {
            if (e.code() == asio::error::not_found) {
                read_buffer_.clear();
                co_return tl::unexpected(TransportError::protocol("Message too large"));
            }
            if (e.code() == asio::error::eof) {
                co_return tl::unexpected(TransportError::closed("Server closed stdout"));
            }
            if (e.code() == asio::error::operation_aborted) {
                co_return tl::unexpected(TransportError::closed("Receive cancelled"));
            }
            co_return tl::unexpected(TransportError::network(
                "Failed to read line: " + std::string(e.what())
            ));
        }

        std::string line = read_buffer_.substr(0, n);
        read_buffer_.erase(0, n);

        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        try {
            co_return Json::parse(line);
        } catch (const std::exception& e) {
            co_return tl::unexpected(TransportError::protocol(
                "Failed to parse JSON: " + std::string(e.what())
            ));
        }
    }
}

}  // namespace mcpmux
