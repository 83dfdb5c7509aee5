#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stderr Pipeline
// ═══════════════════════════════════════════════════════════════════════════
// Drains a child's stderr in the background. Each line is classified by a
// keyword heuristic and forwarded to the server log sink as it arrives;
// nothing is retained. The reader stops at EOF or on the first read error
// and never reports anything upward.

#include "mcpmux/log/server_log.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace mcpmux {

/// Longer lines are forwarded in pieces of this size
inline constexpr std::size_t kMaxStderrLineBytes = 64 * 1024;

/// Case-insensitive keyword match:
///   error | panic | fatal -> Error
///   warn                  -> Warn
///   debug | trace         -> Debug
///   anything else         -> Info
[[nodiscard]] LogLevel classify_stderr_line(std::string_view line);

/// The reader loop itself. Owns `stream` for its whole life.
asio::awaitable<void> read_stderr_lines(
    asio::posix::stream_descriptor stream,
    std::shared_ptr<IServerLogSink> sink,
    std::string space_id,
    std::string server_id
);

/// Start read_stderr_lines() detached on `executor`. Returns false, without
/// touching `stream`, when there is no sink.
bool spawn_stderr_reader(
    asio::any_io_executor executor,
    asio::posix::stream_descriptor&& stream,
    std::shared_ptr<IServerLogSink> sink,
    std::string space_id,
    std::string server_id
);

}  // namespace mcpmux
