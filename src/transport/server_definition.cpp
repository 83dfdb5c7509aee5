#include "mcpmux/transport/server_definition.hpp"

namespace mcpmux {

tl::expected<StdioServerDefinition, ConfigError> StdioServerDefinition::from_json(const Json& j) {
    if (!j.is_object()) {
        return tl::unexpected(ConfigError{"Server definition must be a JSON object"});
    }

    StdioServerDefinition def;

    if (!j.contains("command") || !j["command"].is_string()
        || j["command"].get<std::string>().empty()) {
        return tl::unexpected(ConfigError{"'command' must be a non-empty string"});
    }
    def.command = j["command"].get<std::string>();

    if (j.contains("args")) {
        if (!j["args"].is_array()) {
            return tl::unexpected(ConfigError{"'args' must be an array of strings"});
        }
        for (const auto& arg : j["args"]) {
            if (!arg.is_string()) {
                return tl::unexpected(ConfigError{"'args' must be an array of strings"});
            }
            def.args.push_back(arg.get<std::string>());
        }
    }

    if (j.contains("env")) {
        if (!j["env"].is_object()) {
            return tl::unexpected(ConfigError{"'env' must be an object of strings"});
        }
        for (const auto& [key, value] : j["env"].items()) {
            if (!value.is_string()) {
                return tl::unexpected(ConfigError{"'env." + key + "' must be a string"});
            }
            def.env[key] = value.get<std::string>();
        }
    }

    if (j.contains("connectTimeoutMs")) {
        const auto& timeout = j["connectTimeoutMs"];
        if (!timeout.is_number_integer() || timeout.get<std::int64_t>() <= 0) {
            return tl::unexpected(ConfigError{"'connectTimeoutMs' must be a positive integer"});
        }
        def.connect_timeout = std::chrono::milliseconds(timeout.get<std::int64_t>());
    }

    return def;
}

Json StdioServerDefinition::to_json() const {
    Json j = {
        {"command", command},
        {"args", args},
        {"connectTimeoutMs", connect_timeout.count()}
    };
    j["env"] = Json::object();
    for (const auto& [key, value] : env) {
        j["env"][key] = value;
    }
    return j;
}

StdioTransportConfig StdioServerDefinition::to_transport_config(
    std::string server_id,
    std::string space_id
) const {
    StdioTransportConfig config;
    config.command = command;
    config.args = args;
    config.env = env;
    config.server_id = std::move(server_id);
    config.space_id = std::move(space_id);
    config.connect_timeout = connect_timeout;
    return config;
}

}  // namespace mcpmux
