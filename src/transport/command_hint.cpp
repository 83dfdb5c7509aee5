#include "mcpmux/transport/command_hint.hpp"

#include <algorithm>
#include <cctype>

namespace mcpmux {

namespace {

constexpr std::string_view kExeSuffix = ".exe";

}  // namespace

std::string HintRegistry::program_name(std::string_view command) {
    const auto slash = command.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        command.remove_prefix(slash + 1);
    }

    std::string name(command);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name.size() > kExeSuffix.size()
        && name.compare(name.size() - kExeSuffix.size(), kExeSuffix.size(), kExeSuffix) == 0) {
        name.resize(name.size() - kExeSuffix.size());
    }
    return name;
}

void HintRegistry::add(Matcher matcher, std::string hint) {
    rules_.push_back(Rule{std::move(matcher), std::move(hint)});
}

void HintRegistry::add_program(std::string name, std::string hint) {
    add([name = std::move(name)](std::string_view program) {
        return program == name
            || (program.size() > name.size()
                && program.substr(0, name.size()) == name
                && program[name.size()] == '-');
    }, std::move(hint));
}

std::string HintRegistry::hint_for(std::string_view command) const {
    const auto program = program_name(command);
    for (const auto& rule : rules_) {
        if (rule.matcher(program)) {
            return rule.hint;
        }
    }
    return {};
}

const HintRegistry& default_hint_registry() {
    static const HintRegistry registry = [] {
        HintRegistry r;
        r.add_program("docker", " Ensure Docker Desktop is installed and running.");
        return r;
    }();
    return registry;
}

std::string command_hint(std::string_view command) {
    return default_hint_registry().hint_for(command);
}

}  // namespace mcpmux
