/**
 * @file command_class_registry.hpp
 * @brief Per-node map from command class code to its handler.
 *
 * @details
 * The registry is a plain map keyed by code. Lookup is exact: there is no
 * precedence between handlers and no fallback for unknown codes. Handlers are
 * created through `CommandClass::create()` when a capability is added and are
 * released when it is removed or the registry is cleared.
 *
 * Handlers are handed out as `shared_ptr` so a caller in the middle of a call
 * keeps its handler alive even if the node is removed concurrently.
 */
#ifndef ZMESH_COMMAND_CLASS_REGISTRY_HPP
#define ZMESH_COMMAND_CLASS_REGISTRY_HPP

#include <stdint.h>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "command_class.hpp"

namespace zmesh {

class Controller;

class CommandClassRegistry {
public:
  CommandClassRegistry(uint8_t node_id, Controller& controller);

  CommandClassRegistry(const CommandClassRegistry&) = delete;
  CommandClassRegistry& operator=(const CommandClassRegistry&) = delete;

  /**
   * @brief Add the handler for @p code.
   * @return the new handler, the existing one if already present, or nullptr
   *         (with a warning) if no handler exists for @p code.
   */
  std::shared_ptr<CommandClass> add(uint8_t code);

  /// Handler for @p code, or nullptr.
  std::shared_ptr<CommandClass> find(uint8_t code) const;

  /// @return false if @p code was not registered.
  bool remove(uint8_t code);

  void clear();
  size_t size() const;

  /// Registered codes, ascending.
  std::vector<uint8_t> codes() const;

private:
  const uint8_t node_id_;
  Controller&   controller_;

  mutable std::mutex mutex_;
  std::map<uint8_t, std::shared_ptr<CommandClass>> handlers_;
};

} // namespace zmesh

#endif // ZMESH_COMMAND_CLASS_REGISTRY_HPP
