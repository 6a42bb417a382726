/**
 * @file node.hpp
 * @brief One device on the mesh: its id, its endpoints and its capability handlers.
 */
#ifndef ZMESH_NODE_HPP
#define ZMESH_NODE_HPP

#include <stdint.h>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

#include "address.hpp"
#include "command_class_registry.hpp"

namespace zmesh {

class Controller;

/**
 * @class Node
 * @brief Owned by the controller; never outlives it.
 *
 * Endpoints are declared explicitly (configuration or discovery). The root
 * device always exists and is not listed in `endpoints()`.
 */
class Node {
public:
  Node(uint8_t node_id, Controller& controller);

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  uint8_t node_id() const { return node_id_; }
  Address address() const { return Address(node_id_); }
  Controller& controller() { return controller_; }

  /// @return false if @p endpoint is outside ENDPOINT_ID_MIN..ENDPOINT_ID_MAX.
  bool add_endpoint(uint8_t endpoint);

  /// Root is always present.
  bool has_endpoint(Endpoint endpoint) const;

  /// Declared endpoints, ascending.
  std::vector<uint8_t> endpoints() const;

  CommandClassRegistry& command_classes() { return registry_; }
  const CommandClassRegistry& command_classes() const { return registry_; }

  /// Shorthand for `command_classes().add(code)`.
  std::shared_ptr<CommandClass> add_command_class(uint8_t code) { return registry_.add(code); }

  /// Shorthand for `command_classes().find(code)`.
  std::shared_ptr<CommandClass> get_command_class(uint8_t code) const { return registry_.find(code); }

private:
  const uint8_t node_id_;
  Controller&   controller_;

  mutable std::mutex endpoints_mutex_;
  std::set<uint8_t>  endpoints_;

  CommandClassRegistry registry_;
};

} // namespace zmesh

#endif // ZMESH_NODE_HPP
