#pragma once

#include "mcpmux/events/domain_event.hpp"

#include <algorithm>
#include <mutex>
#include <vector>

namespace mcpmux::test {

/// Records every published event
class EventRecorder final : public IEventSink {
public:
    void publish(const DomainEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    [[nodiscard]] std::vector<DomainEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    [[nodiscard]] std::vector<DomainEventKind> kinds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<DomainEventKind> out;
        for (const auto& e : events_) {
            out.push_back(e.kind);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<DomainEvent> events_;
};

}  // namespace mcpmux::test
