#include "mcpmux/process/child_process.hpp"
#include "mcpmux/platform/command_locator.hpp"
#include "mcpmux/log/logger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcpmux {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

SpawnResult<void> make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
#if defined(__linux__)
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        return tl::unexpected(SpawnError::from_errno(errno, "Failed to create pipe"));
    }
#else
    if (::pipe(fds) == -1) {
        return tl::unexpected(SpawnError::from_errno(errno, "Failed to create pipe"));
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return {};
}

/// One standard stream: what the child sees and what the parent keeps.
struct StreamEnds {
    UniqueFd child;
    UniqueFd parent;
};

SpawnResult<StreamEnds> make_stream(StdioMode mode, bool child_reads) {
    StreamEnds ends;
    if (mode != StdioMode::Pipe) {
        return ends;
    }
    UniqueFd read_end;
    UniqueFd write_end;
    auto piped = make_pipe(read_end, write_end);
    if (!piped) {
        return tl::unexpected(piped.error());
    }
    if (child_reads) {
        ends.child = std::move(read_end);
        ends.parent = std::move(write_end);
    } else {
        ends.child = std::move(write_end);
        ends.parent = std::move(read_end);
    }
    return ends;
}

/// Inherited environment with the overrides' keys replaced.
std::vector<std::string> build_environment(const EnvMap& overrides) {
    std::vector<std::string> out;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        const auto key = std::string(kv.substr(0, kv.find('=')));
        if (overrides.count(key) == 0) {
            out.emplace_back(kv);
        }
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> as_pointer_array(std::vector<std::string>& storage) {
    std::vector<char*> out;
    out.reserve(storage.size() + 1);
    for (auto& s : storage) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// Child side. Runs between fork() and exec(): async-signal-safe calls only,
// no allocation (another thread may have held the malloc lock at fork time).
// ─────────────────────────────────────────────────────────────────────────────

struct ChildFds {
    int stdin_fd;   // -1 = inherit
    int stdout_fd;
    int stderr_fd;
    int error_fd;   // close-on-exec, receives errno on failure
};

[[noreturn]] void fail_child(int error_fd) noexcept {
    const int err = errno;
    ssize_t ignored = ::write(error_fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

// A source fd may itself sit on 0..2 when the parent had a standard stream
// closed; move it out of the way before any dup2 can clobber it.
int lift_above_stdio(int fd, int error_fd) noexcept {
    if (fd < 0 || fd > STDERR_FILENO) {
        return fd;
    }
    const int lifted = ::fcntl(fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
    if (lifted == -1) {
        fail_child(error_fd);
    }
    return lifted;
}

void redirect(int fd, int target, int error_fd) noexcept {
    if (fd < 0) {
        return;
    }
    if (::dup2(fd, target) == -1) {
        fail_child(error_fd);
    }
}

[[noreturn]] void exec_child(
    const char* path,
    char* const* argv,
    char* const* envp,
    ChildFds fds,
    bool new_process_group,
    bool new_session
) noexcept {
    if (new_session) {
        if (::setsid() == -1) {
            fail_child(fds.error_fd);
        }
    } else if (new_process_group && ::setpgid(0, 0) == -1) {
        fail_child(fds.error_fd);
    }

    // The parent may ignore SIGPIPE or block signals; the child starts clean.
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    ::sigemptyset(&dfl.sa_mask);
    ::sigaction(SIGPIPE, &dfl, nullptr);
    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    fds.stdin_fd = lift_above_stdio(fds.stdin_fd, fds.error_fd);
    fds.stdout_fd = lift_above_stdio(fds.stdout_fd, fds.error_fd);
    fds.stderr_fd = lift_above_stdio(fds.stderr_fd, fds.error_fd);

    redirect(fds.stdin_fd, STDIN_FILENO, fds.error_fd);
    redirect(fds.stdout_fd, STDOUT_FILENO, fds.error_fd);
    redirect(fds.stderr_fd, STDERR_FILENO, fds.error_fd);

    ::execve(path, argv, envp);
    fail_child(fds.error_fd);
}

}  // namespace

SpawnError SpawnError::from_errno(int err, std::string_view what) {
    return SpawnError{err, std::string(what) + ": " + std::strerror(err)};
}

// ═══════════════════════════════════════════════════════════════════════════
// Spawn
// ═══════════════════════════════════════════════════════════════════════════

SpawnResult<ChildProcess> ChildProcess::spawn(const ChildSpec& spec) {
    if (spec.program.empty()) {
        return tl::unexpected(SpawnError{EINVAL, "Empty program name"});
    }

    // Resolve before fork: execve does no PATH search, and the child's PATH
    // override must not change which binary the parent meant to run.
    std::string path = spec.program;
    if (path.find('/') == std::string::npos) {
        auto located = locate_command(path, nullptr);
        if (!located) {
            return tl::unexpected(SpawnError::from_errno(ENOENT, spec.program));
        }
        path = located->string();
    }

    // Everything the child touches is allocated here, before fork().
    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.program);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    auto argv = as_pointer_array(argv_storage);

    auto env_storage = build_environment(spec.env);
    auto envp = as_pointer_array(env_storage);

    auto in = make_stream(spec.stdin_mode, true);
    if (!in) return tl::unexpected(in.error());
    auto out = make_stream(spec.stdout_mode, false);
    if (!out) return tl::unexpected(out.error());
    auto err = make_stream(spec.stderr_mode, false);
    if (!err) return tl::unexpected(err.error());

    UniqueFd devnull;
    if (spec.stdin_mode == StdioMode::Null || spec.stdout_mode == StdioMode::Null
        || spec.stderr_mode == StdioMode::Null) {
        devnull.reset(::open("/dev/null", O_RDWR | O_CLOEXEC));
        if (!devnull) {
            return tl::unexpected(SpawnError::from_errno(errno, "Failed to open /dev/null"));
        }
    }

    auto child_fd = [&](StdioMode mode, const StreamEnds& ends) {
        switch (mode) {
            case StdioMode::Pipe:    return ends.child.get();
            case StdioMode::Null:    return devnull.get();
            case StdioMode::Inherit: return -1;
        }
        return -1;
    };

    UniqueFd error_read;
    UniqueFd error_write;
    if (auto piped = make_pipe(error_read, error_write); !piped) {
        return tl::unexpected(piped.error());
    }

    const ChildFds fds{
        child_fd(spec.stdin_mode, *in),
        child_fd(spec.stdout_mode, *out),
        child_fd(spec.stderr_mode, *err),
        error_write.get()
    };

    const pid_t pid = ::fork();
    if (pid == -1) {
        return tl::unexpected(SpawnError::from_errno(errno, "Failed to fork"));
    }
    if (pid == 0) {
        exec_child(path.c_str(), argv.data(), envp.data(), fds,
                   spec.new_process_group, spec.new_session);
    }

    // Parent: drop the child's ends so EOF propagates.
    in->child.reset();
    out->child.reset();
    err->child.reset();
    error_write.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(error_read.get(), &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        return tl::unexpected(SpawnError::from_errno(child_errno, spec.program));
    }

    MCPMUX_LOG_DEBUG("Spawned " + path + " (pid " + std::to_string(pid) + ")");

    ChildProcess child;
    child.pid_ = pid;
    child.process_group_ = spec.new_process_group || spec.new_session;
    child.kill_on_drop_ = spec.kill_on_drop;
    child.stdin_ = std::move(in->parent);
    child.stdout_ = std::move(out->parent);
    child.stderr_ = std::move(err->parent);
    return child;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifetime
// ═══════════════════════════════════════════════════════════════════════════

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , process_group_(other.process_group_)
    , kill_on_drop_(other.kill_on_drop_)
    , exit_code_(std::move(other.exit_code_))
    , stdin_(std::move(other.stdin_))
    , stdout_(std::move(other.stdout_))
    , stderr_(std::move(other.stderr_))
{}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        if (kill_on_drop_) {
            kill_and_reap();
        }
        pid_ = std::exchange(other.pid_, -1);
        process_group_ = other.process_group_;
        kill_on_drop_ = other.kill_on_drop_;
        exit_code_ = std::move(other.exit_code_);
        stdin_ = std::move(other.stdin_);
        stdout_ = std::move(other.stdout_);
        stderr_ = std::move(other.stderr_);
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    if (kill_on_drop_) {
        kill_and_reap();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Status
// ═══════════════════════════════════════════════════════════════════════════

void ChildProcess::record_status(int status) noexcept {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -WTERMSIG(status);
    }
}

std::optional<int> ChildProcess::try_wait() noexcept {
    if (exit_code_ || pid_ <= 0) {
        return exit_code_;
    }
    int status = 0;
    const pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        record_status(status);
    }
    return exit_code_;
}

void ChildProcess::kill() noexcept {
    if (pid_ <= 0 || exit_code_) {
        return;
    }
    ::kill(process_group_ ? -pid_ : pid_, SIGKILL);
}

void ChildProcess::kill_and_reap() noexcept {
    if (pid_ <= 0 || exit_code_) {
        return;
    }
    kill();
    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result == -1 && errno == EINTR);
    if (result == pid_) {
        record_status(status);
    }
}

void ChildProcess::terminate(std::chrono::milliseconds grace) noexcept {
    if (pid_ <= 0 || try_wait()) {
        return;
    }
    ::kill(process_group_ ? -pid_ : pid_, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (!try_wait()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            kill_and_reap();
            return;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

ProcessOutput ChildProcess::wait_with_output(std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;

    ProcessOutput output;
    stdin_.reset();

    const auto deadline = steady_clock::now() + timeout;
    auto remaining_ms = [&]() {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - steady_clock::now()
        ).count();
        return static_cast<int>(left > 0 ? left : 0);
    };

    if (stdout_) {
        std::array<char, 4096> buffer;
        while (true) {
            pollfd pfd{stdout_.get(), POLLIN, 0};
            const int rc = ::poll(&pfd, 1, remaining_ms());
            if (rc == -1) {
                if (errno == EINTR) continue;
                break;
            }
            if (rc == 0) {
                output.timed_out = true;
                break;
            }
            const ssize_t n = ::read(stdout_.get(), buffer.data(), buffer.size());
            if (n == -1) {
                if (errno == EINTR || errno == EAGAIN) continue;
                break;
            }
            if (n == 0) {
                break;
            }
            output.stdout_data.append(buffer.data(), static_cast<std::size_t>(n));
        }
        stdout_.reset();
    }

    while (!output.timed_out && !try_wait()) {
        if (steady_clock::now() >= deadline) {
            output.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    if (output.timed_out) {
        kill_and_reap();
    }
    output.exit_code = exit_code_;
    return output;
}

}  // namespace mcpmux
