// ─────────────────────────────────────────────────────────────────────────────
// mcpmux-probe - one stdio connection attempt from the command line
// ─────────────────────────────────────────────────────────────────────────────
// Runs exactly what the gateway runs when a stdio server is enabled: login
// shell PATH, command lookup, spawn, handshake. Prints the outcome and
// optionally the server's tools.
//
// Usage:
//   mcpmux-probe -c npx -a -y -a @modelcontextprotocol/server-everything
//   mcpmux-probe --config server.json --list-tools
//   mcpmux-probe -c uvx -a mcp-server-git --env GIT_DIR=/repo --timeout 10000
//   mcpmux-probe -c node -a server.js --log-dir ~/.mcpmux/logs --log-level debug
//
// Exit codes: 0 connected, 1 failed, 2 authorization required, 64 bad usage.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcpmux/events/domain_event.hpp"
#include "mcpmux/log/logger.hpp"
#include "mcpmux/log/server_log_manager.hpp"
#include "mcpmux/log/spdlog_logger.hpp"
#include "mcpmux/transport/server_definition.hpp"
#include "mcpmux/transport/stdio_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace mcpmux;

namespace {

constexpr int kExitConnected = 0;
constexpr int kExitFailed = 1;
constexpr int kExitOAuth = 2;
constexpr int kExitUsage = 64;

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset  = "\033[0m";
    const char* bold   = "\033[1m";
    const char* dim    = "\033[2m";
    const char* red    = "\033[31m";
    const char* green  = "\033[32m";
    const char* yellow = "\033[33m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << title << color::c(color::reset) << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

std::optional<StdioServerDefinition> load_definition(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        print_error("Cannot open config file " + path);
        return std::nullopt;
    }

    auto parsed = Json::parse(in, nullptr, false);
    if (parsed.is_discarded()) {
        print_error("Config file " + path + " is not valid JSON");
        return std::nullopt;
    }

    auto def = StdioServerDefinition::from_json(parsed);
    if (!def) {
        print_error(path + ": " + def.error().message);
        return std::nullopt;
    }
    return *def;
}

/// "KEY=VALUE" -> env[KEY] = VALUE
bool apply_env_pairs(const std::vector<std::string>& pairs, EnvMap& env) {
    for (const auto& pair : pairs) {
        if (pair.empty()) {
            continue;
        }
        const auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            print_error("Invalid --env value '" + pair + "', expected KEY=VALUE");
            return false;
        }
        env[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    return true;
}

/// Installs the global logger; the returned pointer stays owned by it.
SpdlogLogger* setup_logging(const cxxopts::ParseResult& result) {
    LoggingConfig config;
    auto level = parse_log_level(result["log-level"].as<std::string>());
    config.level = level.value_or(LogLevel::Warn);
    if (result.count("log-file")) {
        config.file = result["log-file"].as<std::string>();
    }
    auto logger = make_spdlog_logger(config);
    auto* raw = logger.get();
    set_logger(std::move(logger));
    return raw;
}

// ═══════════════════════════════════════════════════════════════════════════
// Probe
// ═══════════════════════════════════════════════════════════════════════════

struct ProbeOptions {
    bool json_output = false;
    bool list_tools = false;
};

asio::awaitable<int> probe(StdioTransport& transport, ProbeOptions options) {
    const auto started = std::chrono::steady_clock::now();
    auto outcome = co_await transport.connect();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    Json report = {
        {"server", transport.description()},
        {"elapsed_ms", elapsed.count()}
    };

    if (auto* failed = std::get_if<Failed>(&outcome)) {
        report["status"] = "failed";
        report["error"] = failed->message;
        if (options.json_output) {
            std::cout << report.dump(2) << "\n";
        } else {
            print_error(failed->message);
        }
        co_return kExitFailed;
    }

    if (auto* oauth = std::get_if<OAuthRequired>(&outcome)) {
        report["status"] = "oauth_required";
        report["data"] = oauth->data;
        if (options.json_output) {
            std::cout << report.dump(2) << "\n";
        } else {
            std::cout << color::c(color::yellow) << "! " << color::c(color::reset)
                      << "Server " << oauth->server_id << " requires authorization\n";
            if (!oauth->data.is_null()) {
                std::cout << color::c(color::dim) << oauth->data.dump(2) << color::c(color::reset) << "\n";
            }
        }
        co_return kExitOAuth;
    }

    auto session = std::get<Connected>(outcome).session;
    const auto& info = session->initialize_result();
    report["status"] = "connected";
    report["server_info"] = info.server_info.to_json();
    report["protocol_version"] = info.protocol_version;
    report["capabilities"] = info.capabilities.to_json();

    if (options.list_tools) {
        auto tools = co_await session->send_request("tools/list");
        if (tools) {
            report["tools"] = (*tools).value("tools", Json::array());
        } else {
            report["tools_error"] = tools.error().message;
        }
    }

    if (options.json_output) {
        std::cout << report.dump(2) << "\n";
    } else {
        print_success("Connected to " + info.server_info.name + " " + info.server_info.version
                      + " in " + format_duration(elapsed));
        std::cout << color::c(color::dim) << "  protocol " << info.protocol_version
                  << color::c(color::reset) << "\n";

        if (report.contains("tools")) {
            print_header("Tools");
            for (const auto& tool : report["tools"]) {
                std::cout << "  " << color::c(color::bold) << tool.value("name", "?")
                          << color::c(color::reset);
                if (tool.contains("description") && tool["description"].is_string()) {
                    std::cout << " - " << tool["description"].get<std::string>();
                }
                std::cout << "\n";
            }
        } else if (report.contains("tools_error")) {
            print_error("tools/list failed: " + report["tools_error"].get<std::string>());
        }
    }

    co_await session->close();
    co_return kExitConnected;
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpmux-probe", "Connect to one stdio MCP server and report the outcome");

    options.add_options()
        // Server
        ("c,command", "Server command", cxxopts::value<std::string>())
        ("a,args", "Argument for the server command (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("e,env", "Environment variable KEY=VALUE (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("config", "JSON server definition file", cxxopts::value<std::string>())
        ("t,timeout", "Connect timeout in milliseconds", cxxopts::value<long>())
        ("server-id", "Server id used for logs and events", cxxopts::value<std::string>()->default_value("probe"))
        ("space", "Space id used for logs and events", cxxopts::value<std::string>()->default_value("default"))

        // Actions
        ("list-tools", "List the server's tools after connecting")

        // Logging
        ("log-level", "Diagnostic log level (trace, debug, info, warn, error)",
            cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Write diagnostic logs to this file", cxxopts::value<std::string>())
        ("log-dir", "Write per-server logs under this directory", cxxopts::value<std::string>())
        ("v,verbose", "Print connection events and server logs")

        // Output
        ("j,json", "Print the outcome as JSON")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return kExitConnected;
        }

        color::enabled = !result.count("no-color");
        auto* logger = setup_logging(result);

        // ─────────────────────────────────────────────────────────────────
        // Server definition: config file first, flags on top
        // ─────────────────────────────────────────────────────────────────
        StdioServerDefinition def;
        if (result.count("config")) {
            auto loaded = load_definition(result["config"].as<std::string>());
            if (!loaded) {
                return kExitUsage;
            }
            def = std::move(*loaded);
        }
        if (result.count("command")) {
            def.command = result["command"].as<std::string>();
        }
        if (result.count("args")) {
            def.args = result["args"].as<std::vector<std::string>>();
        }
        if (result.count("env")
            && !apply_env_pairs(result["env"].as<std::vector<std::string>>(), def.env)) {
            return kExitUsage;
        }
        if (result.count("timeout")) {
            const long timeout = result["timeout"].as<long>();
            if (timeout <= 0) {
                print_error("--timeout must be positive");
                return kExitUsage;
            }
            def.connect_timeout = std::chrono::milliseconds(timeout);
        }
        if (def.command.empty()) {
            print_error("Must specify --command or --config");
            std::cout << "\n" << options.help() << "\n";
            return kExitUsage;
        }

        auto config = def.to_transport_config(
            result["server-id"].as<std::string>(),
            result["space"].as<std::string>()
        );

        if (result.count("log-dir")) {
            config.log_sink = std::make_shared<ServerLogManager>(
                ServerLogConfig{result["log-dir"].as<std::string>()}
            );
        }

        if (result.count("verbose")) {
            auto bus = std::make_shared<EventBus>();
            bus->subscribe([](const DomainEvent& event) {
                std::cerr << color::c(color::dim) << "[event] " << to_string(event.kind);
                if (!event.detail.empty()) {
                    std::cerr << " " << event.detail.dump();
                }
                std::cerr << color::c(color::reset) << "\n";
            });
            config.event_sink = bus;
        }

        ProbeOptions probe_options;
        probe_options.json_output = result.count("json") > 0;
        probe_options.list_tools = result.count("list-tools") > 0;

        // ─────────────────────────────────────────────────────────────────
        // Run
        // ─────────────────────────────────────────────────────────────────
        asio::io_context io;
        StdioTransport transport(std::move(config));
        int exit_code = kExitFailed;

        asio::co_spawn(io, [&]() -> asio::awaitable<void> {
            exit_code = co_await probe(transport, probe_options);
            io.stop();
        }, asio::detached);

        io.run();
        logger->flush();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        std::cout << "\n" << options.help() << "\n";
        return kExitUsage;
    } catch (const spdlog::spdlog_ex& e) {
        print_error(std::string("Cannot set up logging: ") + e.what());
        return kExitUsage;
    }
}
