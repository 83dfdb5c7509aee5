#include "mcpmux/platform/process_platform.hpp"

namespace mcpmux {

void PosixProcessPlatform::configure(ChildSpec& spec) const {
    spec.new_process_group = true;
}

std::vector<std::vector<std::string>> PosixProcessPlatform::login_shell_flag_sets() const {
    // -i sources ~/.zshrc / ~/.bashrc where nvm, Volta and fnm hook in. Some
    // shells refuse -i without a terminal, hence the login-only retry.
    return {
        {"-l", "-i", "-c"},
        {"-l", "-c"}
    };
}

void WindowsProcessPlatform::configure(ChildSpec& spec) const {
    spec.creation_flags |= kCreateNoWindow;
}

const IProcessPlatform& current_platform() noexcept {
#if defined(_WIN32)
    static const WindowsProcessPlatform platform;
#else
    static const PosixProcessPlatform platform;
#endif
    return platform;
}

}  // namespace mcpmux
