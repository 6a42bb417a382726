// -----------------------------------------------------------------------------
// multilevel_switch.cpp - Multi-level switch (dimmer) handler
//
// API & policy table: see include/zmesh/multilevel_switch.hpp
// Tests: tests/test_multilevel_switch.cpp
//
// Locking: level_ is only touched under mutex_. Calls out to the controller
// (read-back requests, event notification) happen after the lock is released,
// because the controller calls back into this handler to build the GET.
// -----------------------------------------------------------------------------
#include "zmesh/multilevel_switch.hpp"
#include "zmesh/controller.hpp"
#include "zmesh/event.hpp"
#include "zmesh/log.hpp"

namespace zmesh {

static const char* TAG = "mlswitch";

MultiLevelSwitchCommandClass::MultiLevelSwitchCommandClass(uint8_t node_id, Controller& controller)
: CommandClass(node_id, controller) {
}

std::optional<uint8_t> MultiLevelSwitchCommandClass::level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

// ---------- inbound ----------

void MultiLevelSwitchCommandClass::handle_application_command(uint8_t command,
                                                              size_t payload_offset,
                                                              Endpoint endpoint,
                                                              const Frame& frame) {
  ZMESH_LOGD(TAG, "Received Switch Multi Level Request for node=%u endpoint=%u",
             unsigned(node_id()), endpoint_number(endpoint));

  switch (command) {
    case SWITCH_MULTILEVEL_SET:
    case SWITCH_MULTILEVEL_GET:
    case SWITCH_MULTILEVEL_SUPPORTED_GET:
    case SWITCH_MULTILEVEL_SUPPORTED_REPORT:
      ZMESH_LOGW(TAG, "Command 0x%02X not implemented.", unsigned(command));
      return;

    case SWITCH_MULTILEVEL_START_LEVEL_CHANGE:
      // dimming in progress; the level is read back on STOP
      ZMESH_LOGT(TAG, "start level change node=%u", unsigned(node_id()));
      return;

    case SWITCH_MULTILEVEL_STOP_LEVEL_CHANGE:
      ZMESH_LOGD(TAG, "stop level change, requesting level node=%u endpoint=%u",
                 unsigned(node_id()), endpoint_number(endpoint));
      controller().request_value(node_id(), code(), endpoint);
      return;

    case SWITCH_MULTILEVEL_REPORT:
      handle_report(payload_offset, endpoint, frame);
      return;

    default:
      ZMESH_LOGW(TAG, "Unsupported command 0x%02X for command class %s (0x%02X).",
                 unsigned(command), label(), unsigned(code()));
      return;
  }
}

void MultiLevelSwitchCommandClass::handle_report(size_t payload_offset,
                                                 Endpoint endpoint,
                                                 const Frame& frame) {
  uint8_t value = 0;
  if (!frame.byte_at(payload_offset, value)) {
    ZMESH_LOGW(TAG, "report without value byte node=%u, dropped", unsigned(node_id()));
    return;
  }
  ZMESH_LOGD(TAG, "Switch Multi Level report node=%u value=0x%02X",
             unsigned(node_id()), unsigned(value));

  if (value > LEVEL_ON) {
    // 100..254 are invalid, 255 is "restore": ask the device what it settled on
    ZMESH_LOGD(TAG, "out-of-range level 0x%02X, reading back node=%u endpoint=%u",
               unsigned(value), unsigned(node_id()), endpoint_number(endpoint));
    controller().request_value(node_id(), code(), endpoint);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = value;
  }

  const EventValue ev = (value == LEVEL_OFF) ? EventValue::state(StateToken::Off)
                      : (value == LEVEL_ON)  ? EventValue::state(StateToken::On)
                                             : EventValue::level(value);
  controller().notify_event_listeners(Event(EventKind::Dimmer, node_id(), endpoint, ev));
}

// ---------- outbound ----------

Frame MultiLevelSwitchCommandClass::get_value_message(Endpoint endpoint) {
  ZMESH_LOGD(TAG, "Creating SWITCH_MULTILEVEL_GET for node=%u", unsigned(node_id()));
  TransportInfo info;
  info.message_class  = MessageClass::SendData;
  info.type           = MessageType::Request;
  info.expected_reply = MessageClass::ApplicationCommandHandler;
  info.priority       = MessagePriority::Get;
  return make_frame(SWITCH_MULTILEVEL_GET, nullptr, 0, info, endpoint);
}

Frame MultiLevelSwitchCommandClass::set_value_message(uint8_t value, Endpoint endpoint) {
  ZMESH_LOGD(TAG, "Creating SWITCH_MULTILEVEL_SET for node=%u level=%u",
             unsigned(node_id()), unsigned(value));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (value <= LEVEL_ON) level_ = value;
  }
  if (value > LEVEL_ON) {
    ZMESH_LOGD(TAG, "level 0x%02X sent as-is, not stored", unsigned(value));
  }
  return make_set(value, endpoint, MessagePriority::Set);
}

Frame MultiLevelSwitchCommandClass::increase_level_message(Endpoint endpoint) {
  uint8_t next;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    next = increased(level_.value_or(LEVEL_OFF));
    level_ = next;
  }
  ZMESH_LOGD(TAG, "Increasing level to %u node=%u", unsigned(next), unsigned(node_id()));
  return make_set(next, endpoint, MessagePriority::Set);
}

Frame MultiLevelSwitchCommandClass::decrease_level_message(Endpoint endpoint) {
  uint8_t next;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    next = decreased(level_.value_or(LEVEL_OFF));
    level_ = next;
  }
  ZMESH_LOGD(TAG, "Decreasing level to %u node=%u", unsigned(next), unsigned(node_id()));
  return make_set(next, endpoint, MessagePriority::Set);
}

uint8_t MultiLevelSwitchCommandClass::increased(uint8_t level) {
  const unsigned next = unsigned(level) + STEP;
  return next > LEVEL_ON ? LEVEL_ON : static_cast<uint8_t>(next);
}

uint8_t MultiLevelSwitchCommandClass::decreased(uint8_t level) {
  if (level >= LEVEL_ON) {
    // largest multiple of STEP not above 99 (95 for STEP 5), not 99 - STEP
    return static_cast<uint8_t>(((LEVEL_ON / STEP) + 1) * STEP - STEP);
  }
  if (level > LEVEL_OFF) {
    return level > STEP ? static_cast<uint8_t>(level - STEP) : LEVEL_OFF;
  }
  return LEVEL_OFF;
}

Frame MultiLevelSwitchCommandClass::make_set(uint8_t value, Endpoint endpoint, MessagePriority priority) {
  TransportInfo info;
  info.message_class  = MessageClass::SendData;
  info.type           = MessageType::Request;
  info.expected_reply = MessageClass::SendData;
  info.priority       = priority;
  return make_frame(SWITCH_MULTILEVEL_SET, &value, 1, info, endpoint);
}

} // namespace zmesh
