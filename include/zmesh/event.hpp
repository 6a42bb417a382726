/**
 * @file event.hpp
 * @brief zmesh events: typed device updates and the listener list that receives them.
 *
 * @details
 * A command class handler turns a trusted inbound report into an `Event` and
 * hands it to the controller's `EventNotifier`. Nothing else builds events:
 * outgoing builders never emit one, and untrusted reports trigger a read-back
 * instead.
 *
 * Listeners derive from `EventListener` (an `etl::observer`) and register with
 * `add_listener()`. Delivery runs on the thread that processed the frame,
 * without the list lock held: a listener may feed further frames to the
 * controller or (un)subscribe from inside `notification()`. Changes to the
 * list take effect from the next event on.
 *
 * @par Example
 * @code
 * struct Printer : zmesh::EventListener {
 *   void notification(const zmesh::Event& e) override {
 *     std::cout << unsigned(e.node_id) << " " << e.value.to_string() << "\n";
 *   }
 * };
 * Printer p;
 * controller.notifier().add_listener(p);
 * @endcode
 */
#ifndef ZMESH_EVENT_HPP
#define ZMESH_EVENT_HPP

#include <stdint.h>
#include <mutex>
#include <string>

#include "etl/observer.h"
#include "etl/vector.h"
#include "address.hpp"

namespace zmesh {

enum class EventKind : uint8_t {
  Dimmer = 0,   ///< multi-level switch level change
};

/// Named states a value can take instead of a number.
enum class StateToken : uint8_t { Off = 0, On };

/**
 * @class EventValue
 * @brief Closed variant: either a state token or a bounded integer level.
 */
class EventValue {
public:
  enum class Type : uint8_t { State, Level };

  static EventValue state(StateToken t) { return EventValue(Type::State, t, 0); }
  static EventValue level(uint8_t v)    { return EventValue(Type::Level, StateToken::Off, v); }

  Type type() const { return type_; }
  bool is_state() const { return type_ == Type::State; }
  bool is_level() const { return type_ == Type::Level; }

  /// Valid only when is_state().
  StateToken token() const { return token_; }
  /// Valid only when is_level().
  uint8_t as_level() const { return level_; }

  /// "OFF", "ON" or the decimal level.
  std::string to_string() const;

  bool operator==(const EventValue& o) const {
    if (type_ != o.type_) return false;
    return is_state() ? token_ == o.token_ : level_ == o.level_;
  }
  bool operator!=(const EventValue& o) const { return !(*this == o); }

private:
  EventValue(Type type, StateToken token, uint8_t level)
  : type_(type), token_(token), level_(level) {}

  Type       type_;
  StateToken token_;
  uint8_t    level_;
};

struct Event {
  EventKind  kind;
  uint8_t    node_id;
  Endpoint   endpoint;
  EventValue value;

  Event(EventKind k, uint8_t node, Endpoint ep, const EventValue& v)
  : kind(k), node_id(node), endpoint(ep), value(v) {}
};

const char* event_kind_name(EventKind k);

/// Receives events; implement `notification(const Event&)`.
using EventListener = etl::observer<const Event&>;

/**
 * @class EventNotifier
 * @brief Fixed-capacity listener list with mutex-guarded add/remove.
 *
 * `notify_event_listeners()` copies the list under the lock and delivers
 * from the copy. A listener removed while an event is in flight may still
 * receive that one event.
 */
class EventNotifier {
public:
  static constexpr size_t LISTENER_CAP = 8;   ///< Max registered listeners

  /// @return false if the list is full. Adding a listener twice is a no-op.
  bool add_listener(EventListener& listener);

  /// @return false if @p listener was not registered.
  bool remove_listener(EventListener& listener);

  size_t listener_count() const;

  /// Deliver @p event to every registered listener, in registration order.
  void notify_event_listeners(const Event& event);

private:
  mutable std::mutex mutex_;
  etl::vector<EventListener*, LISTENER_CAP> listeners_;
};

} // namespace zmesh

#endif // ZMESH_EVENT_HPP
