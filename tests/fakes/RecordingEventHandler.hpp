#pragma once
/** @file  RecordingEventHandler.hpp
 *  @brief ISpaEventHandler that records every forwarded event for assertions.
 */

#include "spa/ISpaEventHandler.hpp"
#include "spa/SpaState.hpp"

#include <algorithm>
#include <functional>
#include <vector>

namespace spaman::test {

  struct RecordedEvent {
    spa::SpaEvent event;
    spa::SpaEventPayload payload;
    spa::SpaState state_at_forward; ///< manager state when the event reached the handler
  };

  class RecordingEventHandler : public spa::ISpaEventHandler {
  public:
    /// Reads the manager state at forwarding time; set once the manager exists.
    std::function<spa::SpaState()> state_probe;
    /// Optional extra behaviour run after recording.
    std::function<Task<void>(spa::SpaEvent, const spa::SpaEventPayload&)> on_event;

    std::vector<RecordedEvent> events;

    Task<void> handle_event(spa::SpaEvent event, const spa::SpaEventPayload& payload) override {
      events.push_back(RecordedEvent{ event, payload, state_probe ? state_probe() : spa::SpaState::IDLE });
      if (on_event) {
        co_await on_event(event, payload);
      }
    }

    std::vector<spa::SpaEvent> sequence(size_t from = 0) const {
      std::vector<spa::SpaEvent> out;
      for (size_t i = from; i < events.size(); ++i) {
        out.push_back(events[i].event);
      }
      return out;
    }

    size_t count(spa::SpaEvent event) const {
      return static_cast<size_t>(std::count_if(events.begin(), events.end(),
                                               [event](const RecordedEvent& r) { return r.event == event; }));
    }

    const RecordedEvent* last(spa::SpaEvent event) const {
      for (auto it = events.rbegin(); it != events.rend(); ++it) {
        if (it->event == event) return &*it;
      }
      return nullptr;
    }
  };

} // namespace spaman::test
