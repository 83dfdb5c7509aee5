#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mcpmux {

/// How one of the child's standard streams is wired
enum class StdioMode : std::uint8_t {
    Null,     // /dev/null
    Pipe,     // New pipe; the parent keeps the other end
    Inherit   // Share the parent's descriptor
};

using EnvMap = std::map<std::string, std::string>;

// ─────────────────────────────────────────────────────────────────────────────
// ChildSpec - everything needed to launch one child process
// ─────────────────────────────────────────────────────────────────────────────
// Built by the caller, adjusted by IProcessPlatform::configure(), then handed
// to ChildProcess::spawn(). Not modified by spawning.

struct ChildSpec {
    /// Absolute path, or a bare name looked up on the parent's PATH
    std::string program;
    std::vector<std::string> args;

    /// Applied on top of the inherited environment
    EnvMap env;

    StdioMode stdin_mode{StdioMode::Inherit};
    StdioMode stdout_mode{StdioMode::Inherit};
    StdioMode stderr_mode{StdioMode::Inherit};

    /// POSIX: setpgid(0, 0) in the child
    bool new_process_group{false};

    /// POSIX: setsid() in the child. Detaches it from our controlling
    /// terminal and implies a new process group.
    bool new_session{false};

    /// Windows process creation flags (CREATE_NO_WINDOW, ...)
    std::uint32_t creation_flags{0};

    /// SIGKILL and reap the child when its ChildProcess owner is destroyed
    bool kill_on_drop{false};
};

}  // namespace mcpmux
