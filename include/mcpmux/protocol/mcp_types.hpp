#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Types
// ═══════════════════════════════════════════════════════════════════════════
// The subset of the MCP schema the gateway needs to bring a session up and
// to route what a server pushes afterwards.

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace mcpmux {

using Json = nlohmann::json;

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            j.value("name", ""),
            j.value("version", "")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

struct ClientCapabilities {
    struct Roots {
        bool list_changed = false;
    };

    std::optional<Roots> roots;
    Json experimental;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (roots) {
            j["roots"] = {{"listChanged", roots->list_changed}};
        }
        if (!experimental.empty()) {
            j["experimental"] = experimental;
        }
        return j;
    }
};

struct ServerCapabilities {
    struct Prompts {
        bool list_changed = false;
    };
    struct Resources {
        bool subscribe = false;
        bool list_changed = false;
    };
    struct Tools {
        bool list_changed = false;
    };
    struct Logging {};

    std::optional<Prompts> prompts;
    std::optional<Resources> resources;
    std::optional<Tools> tools;
    std::optional<Logging> logging;
    Json experimental;

    static ServerCapabilities from_json(const Json& j) {
        ServerCapabilities caps;
        if (!j.is_object()) {
            return caps;
        }
        if (j.contains("prompts")) {
            caps.prompts = Prompts{
                j["prompts"].value("listChanged", false)
            };
        }
        if (j.contains("resources")) {
            caps.resources = Resources{
                j["resources"].value("subscribe", false),
                j["resources"].value("listChanged", false)
            };
        }
        if (j.contains("tools")) {
            caps.tools = Tools{
                j["tools"].value("listChanged", false)
            };
        }
        if (j.contains("logging")) {
            caps.logging = Logging{};
        }
        if (j.contains("experimental")) {
            caps.experimental = j["experimental"];
        }
        return caps;
    }

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (prompts) {
            j["prompts"] = {{"listChanged", prompts->list_changed}};
        }
        if (resources) {
            j["resources"] = {
                {"subscribe", resources->subscribe},
                {"listChanged", resources->list_changed}
            };
        }
        if (tools) {
            j["tools"] = {{"listChanged", tools->list_changed}};
        }
        if (logging) {
            j["logging"] = Json::object();
        }
        if (!experimental.is_null()) {
            j["experimental"] = experimental;
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize Request/Response
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ClientCapabilities capabilities;
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"clientInfo", client_info.to_json()}
        };
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        result.protocol_version = j.value("protocolVersion", "");
        if (j.contains("capabilities")) {
            result.capabilities = ServerCapabilities::from_json(j["capabilities"]);
        }
        if (j.contains("serverInfo") && j["serverInfo"].is_object()) {
            result.server_info = Implementation::from_json(j["serverInfo"]);
        }
        if (j.contains("instructions") && j["instructions"].is_string()) {
            result.instructions = j["instructions"].get<std::string>();
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

struct McpError {
    int code;
    std::string message;
    std::optional<Json> data;

    /// Never throws: a non-object error becomes code 0 with the raw JSON as
    /// message, and mistyped fields fall back to their defaults.
    static McpError from_json(const Json& j) {
        McpError err{0, "", std::nullopt};
        if (!j.is_object()) {
            err.message = j.is_string() ? j.get<std::string>() : j.dump();
            return err;
        }
        if (j.contains("code") && j["code"].is_number_integer()) {
            err.code = j["code"].get<int>();
        }
        if (j.contains("message") && j["message"].is_string()) {
            err.message = j["message"].get<std::string>();
        }
        if (j.contains("data")) {
            err.data = j["data"];
        }
        return err;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"code", code}, {"message", message}};
        if (data) j["data"] = *data;
        return j;
    }
};

// Standard JSON-RPC error codes
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;

    /// Returned by servers that need the user to authorize first
    inline constexpr int Unauthorized = -32001;
}

// ═══════════════════════════════════════════════════════════════════════════
// Method names
// ═══════════════════════════════════════════════════════════════════════════

namespace Method {
    inline constexpr const char* Initialize = "initialize";
    inline constexpr const char* Initialized = "notifications/initialized";
    inline constexpr const char* Ping = "ping";
    inline constexpr const char* LoggingMessage = "notifications/message";
    inline constexpr const char* ToolsListChanged = "notifications/tools/list_changed";
    inline constexpr const char* ResourcesListChanged = "notifications/resources/list_changed";
    inline constexpr const char* PromptsListChanged = "notifications/prompts/list_changed";
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════
// MCP method: "notifications/message"

struct LoggingMessageNotification {
    std::string level;  // syslog names: debug, info, notice, warning, error, ...
    std::optional<std::string> logger;
    Json data;

    static LoggingMessageNotification from_json(const Json& j) {
        LoggingMessageNotification n;
        n.level = j.value("level", "info");
        if (j.contains("logger") && j["logger"].is_string()) {
            n.logger = j["logger"].get<std::string>();
        }
        n.data = j.value("data", Json());
        return n;
    }

    /// `data` as display text: strings verbatim, anything else as JSON
    [[nodiscard]] std::string text() const {
        std::string body = data.is_string() ? data.get<std::string>() : data.dump();
        if (logger) {
            return "[" + *logger + "] " + body;
        }
        return body;
    }
};

}  // namespace mcpmux
