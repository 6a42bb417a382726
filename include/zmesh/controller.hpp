/**
 * @file controller.hpp
 * @brief zmesh Controller: node table, inbound dispatch, read-backs and event fan-out.
 *
 * @details
 * ## Field Brief
 * The controller is the one object every other piece points back to. Nodes
 * live in its table; handlers ask it to send read-backs and to publish
 * events; the link layer hands it every received frame.
 *
 * It knows nothing about serial ports or radios. Outgoing frames go to an
 * `ITransport` supplied at construction; incoming bytes arrive through
 * `handle_incoming()` on whatever thread the link layer uses.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [link layer]                     [Controller]
 *       │                                │
 *   rx bytes + endpoint ── handle_incoming() ─► decode_frame()
 *       │                                │        │
 *       │                                │        ├─ node table lookup
 *       │                                │        ├─ registry lookup (command class)
 *       │                                │        └─ handler->handle_application_command()
 *       │                                │               │            │
 *       │                notify_event_listeners() ◄──────┘            │
 *       │                                │                            │
 *       ◄──────────── enqueue() ── request_value() ◄──────────────────┘
 * ```
 *
 * ---
 *
 * @par Failure Model
 * - **Malformed frame:** `DispatchStatus::Malformed`, warning, dropped.
 * - **Unknown node:** `DispatchStatus::UnknownNode`, warning, dropped.
 * - **No handler for the class:** `DispatchStatus::UnsupportedCommandClass`,
 *   warning, dropped.
 * - **Transport refuses a read-back:** warning, dropped. No retry here.
 *
 * None of these touch handler state and none of them throw.
 *
 * ---
 *
 * @par Threading
 * The node table is guarded by a mutex and hands out `shared_ptr<Node>`.
 * No lock is held while a handler runs, so handlers may call back into
 * `request_value()` and `notify_event_listeners()` freely.
 *
 * @par Minimal Usage Example
 * @code
 * zmesh::transport::QueueTransport link;
 * zmesh::Controller ctl(link);
 * auto node = ctl.add_node(5);
 * node->add_command_class(zmesh::SWITCH_MULTILEVEL);
 *
 * const uint8_t rx[] = {0x05, 0x03, 0x26, 0x03, 0x32};
 * ctl.handle_incoming(rx, sizeof(rx), zmesh::kRootEndpoint);   // Dimmer event, level 50
 * @endcode
 */
#ifndef ZMESH_CONTROLLER_HPP
#define ZMESH_CONTROLLER_HPP

#include <stdint.h>
#include <stddef.h>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "address.hpp"
#include "event.hpp"
#include "frame.hpp"
#include "node.hpp"
#include "transport/transport_base.hpp"

namespace zmesh {

/// Outcome of routing one inbound frame.
enum class DispatchStatus : uint8_t {
  Ok = 0,
  Malformed,                ///< frame failed to decode
  UnknownNode,              ///< no node with that id
  UnsupportedCommandClass,  ///< node has no handler for the class
};

/// Stable lowercase name for logs ("ok", "malformed", ...).
const char* dispatch_status_name(DispatchStatus s);

class Controller {
public:
  explicit Controller(transport::ITransport& transport);

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  // ---- node table ----

  /**
   * @brief Add node @p node_id, or return it if already present.
   * @return nullptr if @p node_id is outside NODE_ID_MIN..NODE_ID_MAX.
   */
  std::shared_ptr<Node> add_node(uint8_t node_id);

  /**
   * @brief Remove a node and tear down all of its handlers.
   * @return false if the node was not present.
   */
  bool remove_node(uint8_t node_id);

  /// Read-only lookup; nullptr when unknown.
  std::shared_ptr<Node> get_node(uint8_t node_id) const;

  size_t node_count() const;

  /// Known node ids, ascending.
  std::vector<uint8_t> node_ids() const;

  // ---- inbound ----

  /**
   * @brief Decode @p data and route it to the addressed node's handler.
   * @param endpoint  Source endpoint as reported by the link layer.
   */
  DispatchStatus handle_incoming(const uint8_t* data, size_t len, Endpoint endpoint);

  /// Route an already decoded frame.
  DispatchStatus handle_incoming(const Frame& frame);

  // ---- outbound ----

  /**
   * @brief Ask a node for its current value (fire-and-forget).
   *
   * Uses the first handler of the node that offers `BasicCommands` to build
   * the GET and enqueues it. Nothing waits for the answer; it arrives later
   * as an ordinary REPORT. With several such classes on one node the first
   * one in code order wins; handlers use the class-named overload instead.
   *
   * @return false if the node is unknown, has no such handler, or the
   *         transport refused the frame.
   */
  bool request_value(uint8_t node_id, Endpoint endpoint);

  /**
   * @brief Read-back built by a named handler.
   *
   * Handlers ask through this form so the GET comes from their own class
   * even when a node carries several classes with basic commands.
   *
   * @return false if the node is unknown, @p command_class is not registered
   *         on it or offers no `BasicCommands`, or the transport refused.
   */
  bool request_value(uint8_t node_id, uint8_t command_class, Endpoint endpoint);

  /// Hand one frame to the transport; warns unless the result is Ok.
  transport::TxResult send(const Frame& frame);

  // ---- events ----

  void notify_event_listeners(const Event& event) { notifier_.notify_event_listeners(event); }
  EventNotifier& notifier() { return notifier_; }

  transport::ITransport& transport() { return transport_; }

private:
  bool send_read_back(BasicCommands& basic, Endpoint endpoint);

  transport::ITransport& transport_;
  EventNotifier          notifier_;

  mutable std::mutex nodes_mutex_;
  std::map<uint8_t, std::shared_ptr<Node>> nodes_;
};

} // namespace zmesh

#endif // ZMESH_CONTROLLER_HPP
