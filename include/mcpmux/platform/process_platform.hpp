#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Process Platform
// ═══════════════════════════════════════════════════════════════════════════
// Per-platform differences in how children are launched and how the user's
// environment is discovered. The core asks current_platform() instead of
// branching on the OS itself.

#include "mcpmux/process/child_spec.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

class IProcessPlatform {
public:
    virtual ~IProcessPlatform() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Apply isolation flags to a spec that has not been spawned yet.
    /// Idempotent; never touches args, env or stdio modes.
    virtual void configure(ChildSpec& spec) const = 0;

    /// Separator between PATH entries
    [[nodiscard]] virtual char path_list_separator() const noexcept = 0;

    /// Whether GUI processes need the login shell to see the user's PATH
    [[nodiscard]] virtual bool supports_login_shell() const noexcept = 0;

    /// Flag sets to try, in order, when asking the login shell for $PATH.
    /// The command string is appended after the last flag.
    [[nodiscard]] virtual std::vector<std::vector<std::string>> login_shell_flag_sets() const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// POSIX: own process group, so SIGINT/SIGTSTP from the parent's terminal
// never reach MCP servers.
// ─────────────────────────────────────────────────────────────────────────────

class PosixProcessPlatform final : public IProcessPlatform {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "posix"; }
    void configure(ChildSpec& spec) const override;
    [[nodiscard]] char path_list_separator() const noexcept override { return ':'; }
    [[nodiscard]] bool supports_login_shell() const noexcept override { return true; }
    [[nodiscard]] std::vector<std::vector<std::string>> login_shell_flag_sets() const override;
};

// ─────────────────────────────────────────────────────────────────────────────
// Windows: a GUI-subsystem host would otherwise get a console window for every
// console-subsystem child. GUI apps already inherit the full PATH.
// ─────────────────────────────────────────────────────────────────────────────

class WindowsProcessPlatform final : public IProcessPlatform {
public:
    static constexpr std::uint32_t kCreateNoWindow = 0x08000000;

    [[nodiscard]] std::string_view name() const noexcept override { return "windows"; }
    void configure(ChildSpec& spec) const override;
    [[nodiscard]] char path_list_separator() const noexcept override { return ';'; }
    [[nodiscard]] bool supports_login_shell() const noexcept override { return false; }
    [[nodiscard]] std::vector<std::vector<std::string>> login_shell_flag_sets() const override {
        return {};
    }
};

/// The implementation for the platform this binary was built for
[[nodiscard]] const IProcessPlatform& current_platform() noexcept;

}  // namespace mcpmux
