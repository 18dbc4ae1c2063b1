#pragma once
#include "cs/drawing/Drawing.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace cs {

enum class EventType : std::uint8_t {
  ToolActivated = 0,
  ToolDeactivated,
  GestureStarted,
  GestureCompleted,
  GestureCancelled,
  HoverChanged,
  DrawingRemoved,
  DrawingsCleared,
  DrawingsImported,
  HistoryChanged
};

const char* toString(EventType type);

struct Event {
  EventType type{EventType::ToolActivated};
  std::string tool;                           // tool name, if any
  DrawingId drawingId{kInvalidDrawingId};
  std::size_t count{0};                       // cleared / imported / remaining
  DomainPoint point;
  bool hasPoint{false};
};

using SubscriptionId = std::uint64_t;
using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe channel. Higher priority runs first;
// equal priorities run in subscription order. A listener that throws
// std::exception is logged and the remaining listeners still run.
class EventBus {
public:
  SubscriptionId subscribe(EventType type, EventHandler handler, int priority = 0);
  SubscriptionId subscribeOnce(EventType type, EventHandler handler, int priority = 0);
  SubscriptionId subscribeAll(EventHandler handler, int priority = 0);

  // Returns false if the id is unknown (or already removed).
  bool unsubscribe(SubscriptionId id);

  void emit(const Event& event);
  void emit(EventType type) { Event e; e.type = type; emit(e); }

  void clear();

  // Listeners that would receive `type`, wildcard listeners included.
  std::size_t listenerCount(EventType type) const;

private:
  struct Listener {
    SubscriptionId id;
    bool wildcard;
    EventType type;
    bool once;
    int priority;
    EventHandler handler;
  };

  SubscriptionId add(bool wildcard, EventType type, EventHandler handler,
                     bool once, int priority);

  std::vector<Listener> listeners_;  // sorted by priority, stable
  SubscriptionId nextId_{1};
};

} // namespace cs
