#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

// ─────────────────────────────────────────────────────────────────────────────
// HintRegistry - remediation text appended to connection failure messages
// ─────────────────────────────────────────────────────────────────────────────
// Rules are tried in registration order against the normalized program name
// (final path segment, lower-cased, ".exe" removed); the first match wins.
// Hints start with a space so they can be appended directly.

class HintRegistry {
public:
    using Matcher = std::function<bool(std::string_view program)>;

    void add(Matcher matcher, std::string hint);

    /// Matches `name` itself and any `name-<suffix>` plugin binary
    void add_program(std::string name, std::string hint);

    [[nodiscard]] std::string hint_for(std::string_view command) const;

    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }

    [[nodiscard]] static std::string program_name(std::string_view command);

private:
    struct Rule {
        Matcher matcher;
        std::string hint;
    };

    std::vector<Rule> rules_;
};

/// Built-in rules (Docker Desktop)
[[nodiscard]] const HintRegistry& default_hint_registry();

/// default_hint_registry().hint_for(command)
[[nodiscard]] std::string command_hint(std::string_view command);

}  // namespace mcpmux
