// ─────────────────────────────────────────────────────────────────────────────
// Command Hint Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpmux/transport/command_hint.hpp"

using namespace mcpmux;

TEST_CASE("program_name normalizes commands", "[hint]") {
    REQUIRE(HintRegistry::program_name("docker") == "docker");
    REQUIRE(HintRegistry::program_name("/usr/local/bin/docker") == "docker");
    REQUIRE(HintRegistry::program_name("C:\\Program Files\\Docker\\Docker.EXE") == "docker");
    REQUIRE(HintRegistry::program_name("npx") == "npx");
    REQUIRE(HintRegistry::program_name(".exe") == ".exe");
}

TEST_CASE("Docker commands get the Docker Desktop hint", "[hint]") {
    const std::string expected = " Ensure Docker Desktop is installed and running.";

    REQUIRE(command_hint("docker") == expected);
    REQUIRE(command_hint("/opt/homebrew/bin/docker") == expected);
    REQUIRE(command_hint("docker.exe") == expected);
    REQUIRE(command_hint("docker-compose") == expected);
}

TEST_CASE("Other commands get no hint", "[hint]") {
    REQUIRE(command_hint("npx").empty());
    REQUIRE(command_hint("uvx").empty());
    REQUIRE(command_hint("dockerd").empty());
    REQUIRE(command_hint("my-docker").empty());
    REQUIRE(command_hint("").empty());
}

TEST_CASE("HintRegistry uses the first matching rule", "[hint]") {
    HintRegistry registry;
    registry.add_program("node", " Install Node.js from https://nodejs.org.");
    registry.add([](std::string_view program) {
        return program.rfind("node", 0) == 0;
    }, " Fallback.");

    REQUIRE(registry.size() == 2);
    REQUIRE(registry.hint_for("node") == " Install Node.js from https://nodejs.org.");
    REQUIRE(registry.hint_for("nodemon") == " Fallback.");
    REQUIRE(registry.hint_for("python3").empty());
}
