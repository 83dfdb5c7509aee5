#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Child Process
// ═══════════════════════════════════════════════════════════════════════════
// fork/exec of a ChildSpec. The parent end of every piped stream is handed
// out as a UniqueFd; the caller wraps it in whatever async primitive it uses.
//
// Spawn failures inside the child (bad executable, exec permission) are
// reported back through a close-on-exec pipe, so spawn() fails synchronously
// instead of producing a child that exits 127.

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ChildProcess is only available on POSIX-compatible systems"
#endif

#include "mcpmux/process/child_spec.hpp"
#include "mcpmux/process/unique_fd.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>  // pid_t

namespace mcpmux {

struct SpawnError {
    int code{0};  // errno
    std::string message;

    [[nodiscard]] static SpawnError from_errno(int err, std::string_view what);
};

template <typename T>
using SpawnResult = tl::expected<T, SpawnError>;

struct ProcessOutput {
    /// Exit code, or the negated signal number; empty if never reaped
    std::optional<int> exit_code;
    bool timed_out{false};
    std::string stdout_data;

    [[nodiscard]] bool success() const noexcept {
        return !timed_out && exit_code && *exit_code == 0;
    }
};

class ChildProcess {
public:
    [[nodiscard]] static SpawnResult<ChildProcess> spawn(const ChildSpec& spec);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /// Parent ends of piped streams; invalid if not piped or already taken
    [[nodiscard]] UniqueFd take_stdin() noexcept { return std::move(stdin_); }
    [[nodiscard]] UniqueFd take_stdout() noexcept { return std::move(stdout_); }
    [[nodiscard]] UniqueFd take_stderr() noexcept { return std::move(stderr_); }

    /// Reap without blocking. Returns the exit code once the child is gone.
    std::optional<int> try_wait() noexcept;

    /// SIGKILL the child (its whole group when it leads one)
    void kill() noexcept;

    /// SIGTERM, then SIGKILL if still alive after `grace`; always reaps
    void terminate(std::chrono::milliseconds grace) noexcept;

    /// Close stdin, drain stdout until EOF and reap. Past `timeout` the child
    /// is killed and the result is marked timed_out.
    [[nodiscard]] ProcessOutput wait_with_output(std::chrono::milliseconds timeout);

    [[nodiscard]] bool leads_process_group() const noexcept { return process_group_; }

private:
    ChildProcess() = default;

    void kill_and_reap() noexcept;
    void record_status(int status) noexcept;

    pid_t pid_{-1};
    bool process_group_{false};
    bool kill_on_drop_{false};
    std::optional<int> exit_code_;

    UniqueFd stdin_;
    UniqueFd stdout_;
    UniqueFd stderr_;
};

}  // namespace mcpmux
