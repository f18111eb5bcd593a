#include "event_bus.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
const char *EventName(const Event &event) {
    switch (event.index()) {
    case 0:
        return "phase_completed";
    case 1:
        return "alarm_fired";
    case 2:
        return "state_changed";
    case 3:
        return "persistence_warning";
    default:
        return "unknown";
    }
}

// ─────────────────────────────────────
int EventBus::Subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    const int token = m_NextToken++;
    m_Handlers.emplace_back(token, std::move(handler));
    return token;
}

// ─────────────────────────────────────
void EventBus::Unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Handlers.erase(std::remove_if(m_Handlers.begin(), m_Handlers.end(),
                                    [token](const auto &h) { return h.first == token; }),
                     m_Handlers.end());
}

// ─────────────────────────────────────
void EventBus::Publish(const Event &event) {
    std::vector<std::pair<int, Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        handlers = m_Handlers;
    }

    spdlog::trace("EventBus: {} -> {} subscribers", EventName(event), handlers.size());
    for (auto &[token, handler] : handlers) {
        try {
            handler(event);
        } catch (const std::exception &e) {
            spdlog::error("EventBus: subscriber {} failed on {}: {}", token, EventName(event),
                          e.what());
        }
    }
}
