#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Shell Environment Resolver
// ═══════════════════════════════════════════════════════════════════════════
// A desktop app launched from Finder/Dock/a .desktop file gets a minimal PATH
// (/usr/bin:/bin:/usr/sbin:/sbin). Tools installed by Homebrew, nvm, Volta,
// pyenv or cargo live elsewhere, and only the user's login shell knows where.
// We ask it once, merge the answer with the ambient PATH, and cache the
// result for the lifetime of the process.

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

/// Ordered, deduplicated list of non-empty directories.
class ResolvedPath {
public:
    ResolvedPath() = default;
    explicit ResolvedPath(std::vector<std::string> entries);

    [[nodiscard]] const std::vector<std::string>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] bool contains(std::string_view dir) const noexcept;

    /// Entries joined with the platform's list separator
    [[nodiscard]] std::string to_string() const;

private:
    std::vector<std::string> entries_;
};

// ─────────────────────────────────────────────────────────────────────────────
// PATH list helpers
// ─────────────────────────────────────────────────────────────────────────────

/// Split on `separator`, dropping empty segments
[[nodiscard]] std::vector<std::string> split_path_list(std::string_view value, char separator);

/// Entries of `primary` in order, then entries of `secondary` not yet seen.
/// Exact string comparison, empty segments dropped.
[[nodiscard]] std::string merge_paths(std::string_view primary, std::string_view secondary);

/// The PATH this process was started with ("" when unset)
[[nodiscard]] std::string ambient_path();

// ─────────────────────────────────────────────────────────────────────────────
// Login shell query
// ─────────────────────────────────────────────────────────────────────────────

struct ShellEnvConfig {
    /// Login shell to ask; empty means $SHELL, then /bin/sh
    std::string shell;

    /// Per attempt. A shell still running after this is killed with its
    /// whole process group.
    std::chrono::milliseconds timeout{std::chrono::seconds(5)};
};

/// Run `shell <flags...> 'printf "%s" "$PATH"'` and return its trimmed output.
/// Nonzero exit, spawn failure, timeout and empty output all yield nullopt.
[[nodiscard]] std::optional<std::string> resolve_path_from_shell(
    const std::string& shell,
    const std::vector<std::string>& flags,
    std::chrono::milliseconds timeout
);

/// Full resolution without the cache: every flag set of the platform in
/// order, first success merged with the ambient PATH.
[[nodiscard]] std::optional<ResolvedPath> resolve_shell_path(const ShellEnvConfig& config = {});

/// Cached resolution. Computed on first call (blocking, may take seconds),
/// then returned unchanged for the life of the process. Always nullopt on
/// platforms without a login shell.
[[nodiscard]] const std::optional<ResolvedPath>& get_shell_path();

/// Whether get_shell_path() would return without blocking
[[nodiscard]] bool shell_path_ready() noexcept;

}  // namespace mcpmux
