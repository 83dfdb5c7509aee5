#pragma once

#include "mcpmux/transport/stdio_transport.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace mcpmux {

struct ConfigError {
    std::string message;
};

// ─────────────────────────────────────────────────────────────────────────────
// StdioServerDefinition - a stdio server as it appears in configuration
// ─────────────────────────────────────────────────────────────────────────────
//
//   {
//     "command": "npx",
//     "args": ["-y", "@modelcontextprotocol/server-everything"],
//     "env": {"DEBUG": "1"},
//     "connectTimeoutMs": 30000
//   }
//
// Only "command" is required.

struct StdioServerDefinition {
    std::string command;
    std::vector<std::string> args;
    EnvMap env;
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};

    [[nodiscard]] static tl::expected<StdioServerDefinition, ConfigError> from_json(const Json& j);

    [[nodiscard]] Json to_json() const;

    /// Transport config with everything but sinks, factory and hints filled in
    [[nodiscard]] StdioTransportConfig to_transport_config(
        std::string server_id,
        std::string space_id
    ) const;
};

}  // namespace mcpmux
