#include "mcpmux/platform/command_locator.hpp"
#include "mcpmux/platform/process_platform.hpp"
#include "mcpmux/log/logger.hpp"

#include <system_error>

#include <unistd.h>

namespace mcpmux {

namespace {

bool has_directory_separator(std::string_view name) {
#if defined(_WIN32)
    return name.find_first_of("/\\") != std::string_view::npos;
#else
    return name.find('/') != std::string_view::npos;
#endif
}

LocateResult check_direct(std::string_view name) {
    const std::filesystem::path candidate{std::string(name)};
    if (is_executable_file(candidate)) {
        return candidate;
    }
    return tl::unexpected(LocateError::not_found(name));
}

}  // namespace

bool is_executable_file(const std::filesystem::path& candidate) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec) || ec) {
        return false;
    }
    return ::access(candidate.c_str(), X_OK) == 0;
}

LocateResult find_in_dirs(std::string_view name, const std::vector<std::string>& dirs) {
    if (name.empty()) {
        return tl::unexpected(LocateError::not_found(name));
    }
    for (const auto& dir : dirs) {
        auto candidate = std::filesystem::path(dir) / std::string(name);
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return tl::unexpected(LocateError::not_found(name));
}

LocateResult locate_command(std::string_view name, const ResolvedPath* path) {
    if (has_directory_separator(name)) {
        auto direct = check_direct(name);
        if (direct) {
            return direct;
        }
        return check_direct(std::string(name) + std::string(kExecutableSuffix));
    }

    const std::vector<std::string> dirs = path != nullptr
        ? path->entries()
        : split_path_list(ambient_path(), current_platform().path_list_separator());

    auto found = find_in_dirs(name, dirs);
    if (!found) {
        found = find_in_dirs(std::string(name) + std::string(kExecutableSuffix), dirs);
    }
    if (!found) {
        MCPMUX_LOG_DEBUG("Command not found: " + std::string(name)
                         + (path != nullptr ? " (resolved PATH)" : " (inherited PATH)"));
        return tl::unexpected(LocateError::not_found(name));
    }
    return found;
}

}  // namespace mcpmux
