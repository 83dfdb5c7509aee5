#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// One JSON-RPC message in, one out. Sessions are written against this and
// never see the process, pipe or socket underneath.

#include "mcpmux/transport/transport_error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

namespace mcpmux {

class IAsyncTransport {
public:
    virtual ~IAsyncTransport() = default;

    /// Get the executor associated with this transport
    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Stop the transport and release what it owns
    [[nodiscard]] virtual asio::awaitable<void> async_stop() = 0;

    /// Send a JSON message
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(Json message) = 0;

    /// Receive the next JSON message. Cancelling the awaiting coroutine
    /// cancels the pending read.
    [[nodiscard]] virtual asio::awaitable<TransportResult<Json>> async_receive() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

}  // namespace mcpmux
