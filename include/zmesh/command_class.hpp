/**
 * @file command_class.hpp
 * @brief zmesh command classes: capability codes and the handler base every capability derives from.
 *
 * @details
 * A *command class* is a family of commands a node supports (dimming, binary
 * switching, metering, ...). It is identified on the wire by one byte, the
 * byte right after the length in every frame.
 *
 * Each node owns one handler instance per supported command class. The
 * handler:
 *  - interprets inbound frames routed to it (`handle_application_command`),
 *  - builds outbound frames for application intents (get / set / adjust),
 *  - keeps whatever protocol state that capability needs for that node.
 *
 * Handlers never emit events from builders. An event only results from a
 * later inbound report.
 *
 * ## Adding a capability
 *  1) Add the code to `CommandClassCode` (and its label).
 *  2) Derive from `CommandClass`, implement `code()` and
 *     `handle_application_command()`.
 *  3) Add a branch to `CommandClass::create()`.
 */
#ifndef ZMESH_COMMAND_CLASS_HPP
#define ZMESH_COMMAND_CLASS_HPP

#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include <memory>
#include <string>

#include "address.hpp"
#include "frame.hpp"

namespace zmesh {

class Controller;

/// Known command class codes. Only SWITCH_MULTILEVEL has a handler.
enum CommandClassCode : uint8_t {
  NO_OPERATION          = 0x00,
  BASIC                 = 0x20,
  CONTROLLER_REPLICATION= 0x21,
  APPLICATION_STATUS    = 0x22,
  SWITCH_BINARY         = 0x25,
  SWITCH_MULTILEVEL     = 0x26,
  SWITCH_ALL            = 0x27,
  SCENE_ACTIVATION      = 0x2B,
  SENSOR_BINARY         = 0x30,
  SENSOR_MULTILEVEL     = 0x31,
  METER                 = 0x32,
  THERMOSTAT_MODE       = 0x40,
  THERMOSTAT_SETPOINT   = 0x43,
  MULTI_CHANNEL         = 0x60,
  CONFIGURATION         = 0x70,
  ALARM                 = 0x71,
  MANUFACTURER_SPECIFIC = 0x72,
  NODE_NAMING           = 0x77,
  BATTERY               = 0x80,
  CLOCK                 = 0x81,
  WAKE_UP               = 0x84,
  ASSOCIATION           = 0x85,
  VERSION               = 0x86,
  MULTI_CMD             = 0x8F,
};

/// Label for a code, e.g. "SWITCH_MULTILEVEL"; "UNKNOWN" if not in the table.
const char* command_class_label(uint8_t code);

/// Reverse of command_class_label(). @return false on an unknown label.
bool command_class_from_label(const std::string& label, uint8_t& out);

/**
 * @class BasicCommands
 * @brief Get / set a single value: what the controller uses for read-backs.
 */
class BasicCommands {
public:
  virtual ~BasicCommands() = default;
  virtual Frame get_value_message(Endpoint endpoint) = 0;
  virtual Frame set_value_message(uint8_t value, Endpoint endpoint) = 0;
};

/**
 * @class CommandClass
 * @brief Base of every capability handler; owned by one node's registry.
 *
 * A handler keeps its node id rather than a reference to the node so a caller
 * still holding the handler after `Controller::remove_node()` never touches a
 * destroyed node. The controller must outlive every handler.
 */
class CommandClass {
public:
  CommandClass(uint8_t node_id, Controller& controller);
  virtual ~CommandClass() = default;

  CommandClass(const CommandClass&) = delete;
  CommandClass& operator=(const CommandClass&) = delete;

  virtual uint8_t code() const = 0;
  const char* label() const { return command_class_label(code()); }

  /// Highest protocol version this handler understands.
  virtual uint8_t max_version() const { return 1; }

  /// Version negotiated with the node (1 until set).
  uint8_t version() const { return version_.load(); }

  /**
   * @brief Record the version the node reports.
   *
   * Versions above max_version() are clamped: newer devices are handled with
   * the older semantics we know. 0 is treated as 1.
   */
  void set_version(uint8_t v);

  /**
   * @brief Interpret one inbound frame already routed to this handler.
   *
   * @param command         Command code (frame byte FRAME_COMMAND_OFFSET).
   * @param payload_offset  Offset of the first payload byte inside @p frame.
   * @param endpoint        Endpoint the frame came from.
   * @param frame           The decoded frame.
   */
  virtual void handle_application_command(uint8_t command,
                                          size_t payload_offset,
                                          Endpoint endpoint,
                                          const Frame& frame) = 0;

  /// Get/set interface if this capability has one; nullptr otherwise.
  virtual BasicCommands* basic_commands() { return nullptr; }

  uint8_t node_id() const { return node_id_; }
  Controller& controller() { return controller_; }

  /// Factory: handler for @p code, or nullptr if the code is unsupported.
  static std::shared_ptr<CommandClass> create(uint8_t code, uint8_t node_id, Controller& controller);

protected:
  /**
   * @brief Encode a frame addressed to this node with this handler's code.
   * @return empty frame (and an error log) if the payload does not fit.
   */
  Frame make_frame(uint8_t command, const uint8_t* payload, size_t payload_len,
                   const TransportInfo& info, Endpoint endpoint) const;

private:
  const uint8_t node_id_;
  Controller&   controller_;
  std::atomic<uint8_t> version_{1};
};

} // namespace zmesh

#endif // ZMESH_COMMAND_CLASS_HPP
