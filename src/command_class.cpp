// -----------------------------------------------------------------------------
// command_class.cpp - Command class labels, handler base and factory
//
// API: see include/zmesh/command_class.hpp
// -----------------------------------------------------------------------------
#include "zmesh/command_class.hpp"
#include "zmesh/multilevel_switch.hpp"
#include "zmesh/log.hpp"

namespace zmesh {

static const char* TAG = "registry";

namespace {

struct LabelEntry {
  uint8_t     code;
  const char* label;
};

const LabelEntry kLabels[] = {
  {NO_OPERATION,           "NO_OPERATION"},
  {BASIC,                  "BASIC"},
  {CONTROLLER_REPLICATION, "CONTROLLER_REPLICATION"},
  {APPLICATION_STATUS,     "APPLICATION_STATUS"},
  {SWITCH_BINARY,          "SWITCH_BINARY"},
  {SWITCH_MULTILEVEL,      "SWITCH_MULTILEVEL"},
  {SWITCH_ALL,             "SWITCH_ALL"},
  {SCENE_ACTIVATION,       "SCENE_ACTIVATION"},
  {SENSOR_BINARY,          "SENSOR_BINARY"},
  {SENSOR_MULTILEVEL,      "SENSOR_MULTILEVEL"},
  {METER,                  "METER"},
  {THERMOSTAT_MODE,        "THERMOSTAT_MODE"},
  {THERMOSTAT_SETPOINT,    "THERMOSTAT_SETPOINT"},
  {MULTI_CHANNEL,          "MULTI_CHANNEL"},
  {CONFIGURATION,          "CONFIGURATION"},
  {ALARM,                  "ALARM"},
  {MANUFACTURER_SPECIFIC,  "MANUFACTURER_SPECIFIC"},
  {NODE_NAMING,            "NODE_NAMING"},
  {BATTERY,                "BATTERY"},
  {CLOCK,                  "CLOCK"},
  {WAKE_UP,                "WAKE_UP"},
  {ASSOCIATION,            "ASSOCIATION"},
  {VERSION,                "VERSION"},
  {MULTI_CMD,              "MULTI_CMD"},
};

} // namespace

const char* command_class_label(uint8_t code) {
  for (const auto& e : kLabels) {
    if (e.code == code) return e.label;
  }
  return "UNKNOWN";
}

bool command_class_from_label(const std::string& label, uint8_t& out) {
  for (const auto& e : kLabels) {
    if (label == e.label) { out = e.code; return true; }
  }
  return false;
}

// ---------- CommandClass ----------

CommandClass::CommandClass(uint8_t node_id, Controller& controller)
: node_id_(node_id), controller_(controller) {
}

void CommandClass::set_version(uint8_t v) {
  if (v == 0) v = 1;
  if (v > max_version()) {
    ZMESH_LOGW(TAG, "node=%u %s version %u above supported %u, using %u",
               unsigned(node_id_), label(), unsigned(v),
               unsigned(max_version()), unsigned(max_version()));
    v = max_version();
  }
  version_.store(v);
}

Frame CommandClass::make_frame(uint8_t command, const uint8_t* payload, size_t payload_len,
                               const TransportInfo& info, Endpoint endpoint) const {
  Frame f;
  const FrameStatus st = encode_frame(Address(node_id_, endpoint), code(), command,
                                      payload, payload_len, f);
  if (st != FrameStatus::Ok) {
    ZMESH_LOGE(TAG, "encode failed node=%u class=%s command=0x%02X reason=%s",
               unsigned(node_id_), label(), unsigned(command), frame_status_name(st));
    return f;
  }
  f.set_transport(info);
  return f;
}

std::shared_ptr<CommandClass> CommandClass::create(uint8_t code, uint8_t node_id, Controller& controller) {
  switch (code) {
    case SWITCH_MULTILEVEL:
      return std::make_shared<MultiLevelSwitchCommandClass>(node_id, controller);
    default:
      return nullptr;
  }
}

} // namespace zmesh
