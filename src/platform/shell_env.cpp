#include "mcpmux/platform/shell_env.hpp"
#include "mcpmux/platform/process_platform.hpp"
#include "mcpmux/process/child_process.hpp"
#include "mcpmux/log/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <unordered_set>

namespace mcpmux {

namespace {

constexpr const char* kDefaultShell = "/bin/sh";
constexpr const char* kPrintPathCommand = "printf \"%s\" \"$PATH\"";

std::atomic<bool> g_shell_path_ready{false};

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string join(const std::vector<std::string>& parts, char separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.push_back(separator);
        }
        out += parts[i];
    }
    return out;
}

std::string user_shell(const ShellEnvConfig& config) {
    if (!config.shell.empty()) {
        return config.shell;
    }
    const char* shell = std::getenv("SHELL");
    return (shell != nullptr && *shell != '\0') ? shell : kDefaultShell;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// ResolvedPath
// ─────────────────────────────────────────────────────────────────────────────

ResolvedPath::ResolvedPath(std::vector<std::string> entries) {
    std::unordered_set<std::string> seen;
    for (auto& entry : entries) {
        if (!entry.empty() && seen.insert(entry).second) {
            entries_.push_back(std::move(entry));
        }
    }
}

bool ResolvedPath::contains(std::string_view dir) const noexcept {
    return std::find(entries_.begin(), entries_.end(), dir) != entries_.end();
}

std::string ResolvedPath::to_string() const {
    return join(entries_, current_platform().path_list_separator());
}

// ─────────────────────────────────────────────────────────────────────────────
// PATH list helpers
// ─────────────────────────────────────────────────────────────────────────────

std::vector<std::string> split_path_list(std::string_view value, char separator) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= value.size()) {
        auto end = value.find(separator, start);
        if (end == std::string_view::npos) {
            end = value.size();
        }
        if (end > start) {
            out.emplace_back(value.substr(start, end - start));
        }
        start = end + 1;
    }
    return out;
}

std::string merge_paths(std::string_view primary, std::string_view secondary) {
    const char sep = current_platform().path_list_separator();
    auto entries = split_path_list(primary, sep);
    auto rest = split_path_list(secondary, sep);
    entries.insert(entries.end(),
                   std::make_move_iterator(rest.begin()),
                   std::make_move_iterator(rest.end()));
    return ResolvedPath(std::move(entries)).to_string();
}

std::string ambient_path() {
    const char* path = std::getenv("PATH");
    return path != nullptr ? path : "";
}

// ─────────────────────────────────────────────────────────────────────────────
// Login shell query
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::string> resolve_path_from_shell(
    const std::string& shell,
    const std::vector<std::string>& flags,
    std::chrono::milliseconds timeout
) {
    ChildSpec spec;
    spec.program = shell;
    spec.args = flags;
    spec.args.emplace_back(kPrintPathCommand);
    spec.stdin_mode = StdioMode::Null;
    spec.stdout_mode = StdioMode::Pipe;
    spec.stderr_mode = StdioMode::Null;
    // An interactive shell opens /dev/tty and stops itself with SIGTTIN when
    // it is in a background group of our terminal; give it no terminal.
    spec.new_session = true;
    spec.kill_on_drop = true;

    auto child = ChildProcess::spawn(spec);
    if (!child) {
        MCPMUX_LOG_DEBUG("Failed to spawn shell " + shell + ": " + child.error().message);
        return std::nullopt;
    }

    auto output = child->wait_with_output(timeout);
    if (output.timed_out) {
        MCPMUX_LOG_DEBUG("Shell " + shell + " timed out after "
                         + std::to_string(timeout.count()) + "ms");
        return std::nullopt;
    }
    if (!output.success()) {
        MCPMUX_LOG_DEBUG("Shell " + shell + " exited with status "
                         + std::to_string(output.exit_code.value_or(-1)));
        return std::nullopt;
    }

    auto path = trim(output.stdout_data);
    if (path.empty()) {
        return std::nullopt;
    }
    return std::string(path);
}

std::optional<ResolvedPath> resolve_shell_path(const ShellEnvConfig& config) {
    const auto& platform = current_platform();
    if (!platform.supports_login_shell()) {
        return std::nullopt;
    }

    const auto shell = user_shell(config);
    MCPMUX_LOG_INFO("Resolving PATH from login shell " + shell);

    const auto flag_sets = platform.login_shell_flag_sets();
    for (std::size_t i = 0; i < flag_sets.size(); ++i) {
        if (i > 0) {
            MCPMUX_LOG_DEBUG("Retrying shell PATH query without interactive mode");
        }
        auto shell_path = resolve_path_from_shell(shell, flag_sets[i], config.timeout);
        if (!shell_path) {
            continue;
        }

        const auto ambient = ambient_path();
        const char sep = platform.path_list_separator();
        ResolvedPath resolved(split_path_list(merge_paths(*shell_path, ambient), sep));

        get_logger().info_fmt(
            "Resolved PATH from login shell: {} entries (shell: {}, ambient: {})",
            resolved.size(),
            split_path_list(*shell_path, sep).size(),
            split_path_list(ambient, sep).size()
        );
        MCPMUX_LOG_DEBUG("Resolved PATH: " + resolved.to_string());
        return resolved;
    }

    MCPMUX_LOG_WARN("Could not resolve PATH from login shell " + shell
                    + "; using the inherited PATH");
    return std::nullopt;
}

const std::optional<ResolvedPath>& get_shell_path() {
    static const std::optional<ResolvedPath> cached = [] {
        auto resolved = resolve_shell_path();
        g_shell_path_ready.store(true, std::memory_order_release);
        return resolved;
    }();
    return cached;
}

bool shell_path_ready() noexcept {
    return g_shell_path_ready.load(std::memory_order_acquire);
}

}  // namespace mcpmux
