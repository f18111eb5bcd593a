#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "common.hpp"

struct PhaseCompletedEvent {
    SessionRecord record;
};

struct AlarmFiredEvent {
    int64_t alarm_id = 0;
    std::string label;
    std::string sound_ref; // opaque, never checked for existence
    TimeOfDay time;
    double fired_at = 0.0;
};

struct StateChangedEvent {
    SessionSnapshot snapshot;
    bool countdown_started = false; // Start, Resume or auto-start of the next phase
};

struct PersistenceWarningEvent {
    std::string message;
    SessionRecord record;
};

using Event =
    std::variant<PhaseCompletedEvent, AlarmFiredEvent, StateChangedEvent, PersistenceWarningEvent>;

const char *EventName(const Event &event);

class EventBus {
  public:
    using Handler = std::function<void(const Event &)>;

    int Subscribe(Handler handler);
    void Unsubscribe(int token);

    // Handlers run on the publishing thread, outside the bus lock.
    void Publish(const Event &event);

  private:
    std::mutex m_Mutex;
    std::vector<std::pair<int, Handler>> m_Handlers;
    int m_NextToken = 1;
};
