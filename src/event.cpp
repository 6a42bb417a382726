// -----------------------------------------------------------------------------
// event.cpp - Event values and the listener list
//
// API: see include/zmesh/event.hpp
// -----------------------------------------------------------------------------
#include "zmesh/event.hpp"
#include "zmesh/log.hpp"

namespace zmesh {

static const char* TAG = "notifier";

std::string EventValue::to_string() const {
  if (is_state()) return token_ == StateToken::On ? "ON" : "OFF";
  return std::to_string(unsigned(level_));
}

const char* event_kind_name(EventKind k) {
  switch (k) {
    case EventKind::Dimmer: return "dimmer";
  }
  return "unknown";
}

bool EventNotifier::add_listener(EventListener& listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (EventListener* l : listeners_) {
    if (l == &listener) return true;               // already registered
  }
  if (listeners_.full()) {
    ZMESH_LOGW(TAG, "listener list full (cap=%u)", unsigned(LISTENER_CAP));
    return false;
  }
  listeners_.push_back(&listener);
  return true;
}

bool EventNotifier::remove_listener(EventListener& listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
    if (*it == &listener) {
      listeners_.erase(it);
      return true;
    }
  }
  return false;
}

size_t EventNotifier::listener_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

void EventNotifier::notify_event_listeners(const Event& event) {
  etl::vector<EventListener*, LISTENER_CAP> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.assign(listeners_.begin(), listeners_.end());
  }
  ZMESH_LOGT(TAG, "notify kind=%s node=%u endpoint=%u value=%s listeners=%u",
             event_kind_name(event.kind), unsigned(event.node_id),
             endpoint_number(event.endpoint), event.value.to_string().c_str(),
             unsigned(snapshot.size()));
  // lock released: a listener may re-enter the controller
  for (EventListener* l : snapshot) {
    l->notification(event);
  }
}

} // namespace zmesh
