#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace mcpmux {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category { Network, Timeout, Protocol, Closed };

    Category category{};
    std::string message;

    static TransportError network(std::string msg) {
        return {Category::Network, std::move(msg)};
    }

    static TransportError timeout(std::string msg) {
        return {Category::Timeout, std::move(msg)};
    }

    static TransportError protocol(std::string msg) {
        return {Category::Protocol, std::move(msg)};
    }

    static TransportError closed(std::string msg = "Transport is closed") {
        return {Category::Closed, std::move(msg)};
    }
};

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

enum class TransportType : std::uint8_t {
    Stdio,
    Http
};

[[nodiscard]] constexpr std::string_view to_string(TransportType type) noexcept {
    switch (type) {
        case TransportType::Stdio: return "stdio";
        case TransportType::Http:  return "http";
    }
    return "unknown";
}

}  // namespace mcpmux
