#pragma once

#include "mcpmux/platform/shell_env.hpp"

#include <tl/expected.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

struct LocateError {
    enum class Code { NotFound };

    Code code{Code::NotFound};
    std::string command;

    [[nodiscard]] static LocateError not_found(std::string_view command) {
        return LocateError{Code::NotFound, std::string(command)};
    }
};

using LocateResult = tl::expected<std::filesystem::path, LocateError>;

/// Suffix tried after the bare name; Windows executables found via a
/// POSIX-style PATH (WSL mounts, Git Bash) carry it.
inline constexpr std::string_view kExecutableSuffix = ".exe";

/// Regular file (after following symlinks) the current user may execute
[[nodiscard]] bool is_executable_file(const std::filesystem::path& candidate);

/// First directory in `dirs` holding an executable `name`
[[nodiscard]] LocateResult find_in_dirs(std::string_view name, const std::vector<std::string>& dirs);

/// Find `name`, then `name.exe`, in `path`, or in the ambient PATH when
/// `path` is null. Names containing a directory separator are checked as
/// paths directly.
[[nodiscard]] LocateResult locate_command(std::string_view name, const ResolvedPath* path);

}  // namespace mcpmux
