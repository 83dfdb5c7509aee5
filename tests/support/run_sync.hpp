#pragma once

// Drive a coroutine to completion on a local io_context. Stops the context
// as soon as the coroutine finishes, so detached work it started (session
// dispatchers, stderr readers) does not keep the call blocked; that work
// resumes on the next run_sync()/run_for() on the same context.

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <future>
#include <utility>

namespace mcpmux::test {

template <typename T>
T run_sync(asio::io_context& io, asio::awaitable<T>&& coro) {
    std::promise<T> promise;
    auto future = promise.get_future();

    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        try {
            promise.set_value(co_await std::move(coro));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
        io.stop();
    }, asio::detached);

    io.restart();
    io.run();

    return future.get();
}

inline void run_sync(asio::io_context& io, asio::awaitable<void>&& coro) {
    std::promise<void> promise;
    auto future = promise.get_future();

    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        try {
            co_await std::move(coro);
            promise.set_value();
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
        io.stop();
    }, asio::detached);

    io.restart();
    io.run();

    future.get();
}

/// Let background work make progress for a while
inline void run_for(asio::io_context& io, std::chrono::milliseconds duration) {
    io.restart();
    io.run_for(duration);
}

}  // namespace mcpmux::test
