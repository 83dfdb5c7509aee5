#include "mcpmux/diagnostics/stderr_pipeline.hpp"
#include "mcpmux/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/read_until.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace mcpmux {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_any(std::string_view haystack, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    });
}

void forward_line(
    std::string_view line,
    IServerLogSink& sink,
    const std::string& space_id,
    const std::string& server_id
) {
    if (!line.empty() && line.back() == '\n') {
        line.remove_suffix(1);
    }
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return;
    }

    ServerLog entry(classify_stderr_line(line), LogSource::Stderr, std::string(line));
    auto appended = sink.append(space_id, server_id, entry);
    if (!appended) {
        MCPMUX_LOG_TRACE("Dropped stderr line for " + server_id + ": " + appended.error().message);
    }
}

}  // namespace

LogLevel classify_stderr_line(std::string_view line) {
    const auto lower = to_lower(line);
    if (contains_any(lower, {"error", "panic", "fatal"})) {
        return LogLevel::Error;
    }
    if (contains_any(lower, {"warn"})) {
        return LogLevel::Warn;
    }
    if (contains_any(lower, {"debug", "trace"})) {
        return LogLevel::Debug;
    }
    return LogLevel::Info;
}

asio::awaitable<void> read_stderr_lines(
    asio::posix::stream_descriptor stream,
    std::shared_ptr<IServerLogSink> sink,
    std::string space_id,
    std::string server_id
) {
    std::string buffer;
    buffer.reserve(4096);

    while (true) {
        asio::error_code ec;
        const std::size_t n = co_await asio::async_read_until(
            stream,
            asio::dynamic_buffer(buffer, kMaxStderrLineBytes),
            '\n',
            asio::redirect_error(asio::use_awaitable, ec)
        );

        if (!ec) {
            forward_line(std::string_view(buffer).substr(0, n), *sink, space_id, server_id);
            buffer.erase(0, n);
            continue;
        }

        if (ec == asio::error::not_found) {
            // Buffer full without a newline: ship what we have.
            forward_line(buffer, *sink, space_id, server_id);
            buffer.clear();
            continue;
        }

        // EOF or a read error. A final line without a newline still counts.
        if (!buffer.empty()) {
            forward_line(buffer, *sink, space_id, server_id);
        }
        if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
            MCPMUX_LOG_TRACE("Stderr read error for " + server_id + ": " + ec.message());
        }
        break;
    }

    MCPMUX_LOG_DEBUG("Stderr reader finished for " + server_id);
}

bool spawn_stderr_reader(
    asio::any_io_executor executor,
    asio::posix::stream_descriptor&& stream,
    std::shared_ptr<IServerLogSink> sink,
    std::string space_id,
    std::string server_id
) {
    if (!sink) {
        return false;
    }
    asio::co_spawn(
        executor,
        read_stderr_lines(std::move(stream), std::move(sink), std::move(space_id), std::move(server_id)),
        asio::detached
    );
    return true;
}

}  // namespace mcpmux
