#include "cs/events/EventBus.hpp"

#include <cstdio>
#include <exception>

namespace cs {

const char* toString(EventType type) {
  switch (type) {
    case EventType::ToolActivated:    return "ToolActivated";
    case EventType::ToolDeactivated:  return "ToolDeactivated";
    case EventType::GestureStarted:   return "GestureStarted";
    case EventType::GestureCompleted: return "GestureCompleted";
    case EventType::GestureCancelled: return "GestureCancelled";
    case EventType::HoverChanged:     return "HoverChanged";
    case EventType::DrawingRemoved:   return "DrawingRemoved";
    case EventType::DrawingsCleared:  return "DrawingsCleared";
    case EventType::DrawingsImported: return "DrawingsImported";
    case EventType::HistoryChanged:   return "HistoryChanged";
    default: return "unknown";
  }
}

SubscriptionId EventBus::add(bool wildcard, EventType type, EventHandler handler,
                             bool once, int priority) {
  if (!handler) return 0;
  Listener l{nextId_++, wildcard, type, once, priority, std::move(handler)};

  // Insert after every listener with priority >= ours.
  auto it = listeners_.begin();
  while (it != listeners_.end() && it->priority >= priority) ++it;
  listeners_.insert(it, std::move(l));
  return nextId_ - 1;
}

SubscriptionId EventBus::subscribe(EventType type, EventHandler handler, int priority) {
  return add(false, type, std::move(handler), false, priority);
}

SubscriptionId EventBus::subscribeOnce(EventType type, EventHandler handler, int priority) {
  return add(false, type, std::move(handler), true, priority);
}

SubscriptionId EventBus::subscribeAll(EventHandler handler, int priority) {
  return add(true, EventType::ToolActivated, std::move(handler), false, priority);
}

bool EventBus::unsubscribe(SubscriptionId id) {
  for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
    if (it->id == id) {
      listeners_.erase(it);
      return true;
    }
  }
  return false;
}

void EventBus::emit(const Event& event) {
  // Snapshot first: listeners may subscribe or unsubscribe while running.
  std::vector<Listener> targets;
  for (const auto& l : listeners_) {
    if (l.wildcard || l.type == event.type) targets.push_back(l);
  }
  for (const auto& l : targets) {
    if (l.once) unsubscribe(l.id);
  }

  for (const auto& l : targets) {
    try {
      l.handler(event);
    } catch (const std::exception& e) {
      std::fprintf(stderr, "EventBus::emit: listener %llu for %s threw: %s\n",
                   static_cast<unsigned long long>(l.id), toString(event.type),
                   e.what());
    }
  }
}

void EventBus::clear() {
  listeners_.clear();
}

std::size_t EventBus::listenerCount(EventType type) const {
  std::size_t n = 0;
  for (const auto& l : listeners_) {
    if (l.wildcard || l.type == type) ++n;
  }
  return n;
}

} // namespace cs
