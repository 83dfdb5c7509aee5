#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Domain Events
// ═══════════════════════════════════════════════════════════════════════════
// Connection lifecycle and server-pushed changes, broadcast to whoever in the
// gateway cares (UI, feature cache, client notifier).

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

enum class DomainEventKind : std::uint8_t {
    ServerConnecting,
    ServerConnected,
    ServerConnectFailed,
    ToolsListChanged,
    ResourcesListChanged,
    PromptsListChanged
};

[[nodiscard]] constexpr std::string_view to_string(DomainEventKind kind) noexcept {
    switch (kind) {
        case DomainEventKind::ServerConnecting:     return "server_connecting";
        case DomainEventKind::ServerConnected:      return "server_connected";
        case DomainEventKind::ServerConnectFailed:  return "server_connect_failed";
        case DomainEventKind::ToolsListChanged:     return "tools_list_changed";
        case DomainEventKind::ResourcesListChanged: return "resources_list_changed";
        case DomainEventKind::PromptsListChanged:   return "prompts_list_changed";
    }
    return "unknown";
}

struct DomainEvent {
    DomainEventKind kind;
    std::string space_id;
    std::string server_id;

    /// Kind-specific payload (failure message, server info, ...)
    nlohmann::json detail = nlohmann::json::object();
};

class IEventSink {
public:
    virtual ~IEventSink() = default;

    /// Must not block; called from connection coroutines.
    virtual void publish(const DomainEvent& event) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// EventBus - synchronous fan-out to registered handlers
// ─────────────────────────────────────────────────────────────────────────────

class EventBus final : public IEventSink {
public:
    using Handler = std::function<void(const DomainEvent&)>;

    void subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.push_back(std::move(handler));
    }

    void publish(const DomainEvent& event) override {
        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers = handlers_;
        }
        for (const auto& handler : handlers) {
            handler(event);
        }
    }

private:
    std::mutex mutex_;
    std::vector<Handler> handlers_;
};

}  // namespace mcpmux
