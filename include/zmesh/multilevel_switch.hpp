/**
 * @file multilevel_switch.hpp
 * @brief Multi-level switch (dimmer) command class handler.
 *
 * @details
 * Dimmers report a level from 0 (off) to 99 (fully on). 255 (0xFF) on the
 * wire means "restore the previous level" and is never a resting level.
 *
 * ## Inbound policy
 * | command              | effect                                              |
 * |----------------------|-----------------------------------------------------|
 * | REPORT 0             | level = 0, event OFF                                |
 * | REPORT 1..98         | level = v, event v                                  |
 * | REPORT 99            | level = 99, event ON                                |
 * | REPORT 100..255      | no store, no event, read-back GET                   |
 * | START_LEVEL_CHANGE   | ignored                                             |
 * | STOP_LEVEL_CHANGE    | read-back GET (settled level unknown after dimming) |
 * | SET, GET, SUPPORTED_*| logged "not implemented", ignored                   |
 *
 * ## Outbound
 * Builders are optimistic: the stored level changes as soon as the frame is
 * built, before the device confirms anything. Increase steps by STEP and
 * clamps at 99. Decrease from 99 snaps to the largest multiple of STEP not
 * above 99 (95), otherwise steps down by STEP and stops at 0.
 *
 * The level is guarded by a per-instance mutex; the receive path and the
 * caller path may run on different threads.
 */
#ifndef ZMESH_MULTILEVEL_SWITCH_HPP
#define ZMESH_MULTILEVEL_SWITCH_HPP

#include <stdint.h>
#include <mutex>
#include <optional>

#include "command_class.hpp"

namespace zmesh {

class MultiLevelSwitchCommandClass : public CommandClass, public BasicCommands {
public:
  /// @name Command codes
  ///@{
  static constexpr uint8_t SWITCH_MULTILEVEL_SET                = 0x01;
  static constexpr uint8_t SWITCH_MULTILEVEL_GET                = 0x02;
  static constexpr uint8_t SWITCH_MULTILEVEL_REPORT             = 0x03;
  static constexpr uint8_t SWITCH_MULTILEVEL_START_LEVEL_CHANGE = 0x04;
  static constexpr uint8_t SWITCH_MULTILEVEL_STOP_LEVEL_CHANGE  = 0x05;
  static constexpr uint8_t SWITCH_MULTILEVEL_SUPPORTED_GET      = 0x06;
  static constexpr uint8_t SWITCH_MULTILEVEL_SUPPORTED_REPORT   = 0x07;
  ///@}

  static constexpr uint8_t LEVEL_OFF     = 0;
  static constexpr uint8_t LEVEL_ON      = 99;    ///< highest resting level
  static constexpr uint8_t LEVEL_RESTORE = 0xFF;  ///< wire sentinel, never stored
  static constexpr uint8_t STEP          = 5;     ///< increase/decrease step

  MultiLevelSwitchCommandClass(uint8_t node_id, Controller& controller);

  uint8_t code() const override { return SWITCH_MULTILEVEL; }
  uint8_t max_version() const override { return 3; }

  void handle_application_command(uint8_t command,
                                  size_t payload_offset,
                                  Endpoint endpoint,
                                  const Frame& frame) override;

  BasicCommands* basic_commands() override { return this; }

  /// Last known level; empty until the first report or builder call.
  std::optional<uint8_t> level() const;

  /// GET, no payload.
  Frame get_value_message(Endpoint endpoint) override;

  /**
   * @brief SET carrying @p value as-is.
   *
   * Values 0..99 become the stored level immediately. Anything above 99
   * (typically 0xFF, "restore") is sent but not stored; the next report
   * settles it.
   */
  Frame set_value_message(uint8_t value, Endpoint endpoint) override;

  /// SET with level + STEP, clamped at 99. Unknown level counts as 0.
  Frame increase_level_message(Endpoint endpoint = kRootEndpoint);

  /// SET with the decreased level (see file notes for the 99 boundary).
  Frame decrease_level_message(Endpoint endpoint = kRootEndpoint);

  /// Pure level arithmetic used by the builders; exposed for tests.
  static uint8_t increased(uint8_t level);
  static uint8_t decreased(uint8_t level);

private:
  void handle_report(size_t payload_offset, Endpoint endpoint, const Frame& frame);
  Frame make_set(uint8_t value, Endpoint endpoint, MessagePriority priority);

  mutable std::mutex mutex_;
  std::optional<uint8_t> level_;
};

} // namespace zmesh

#endif // ZMESH_MULTILEVEL_SWITCH_HPP
