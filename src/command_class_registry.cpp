// -----------------------------------------------------------------------------
// command_class_registry.cpp - Per-node handler map
//
// API: see include/zmesh/command_class_registry.hpp
// Tests: tests/test_registry.cpp
// -----------------------------------------------------------------------------
#include "zmesh/command_class_registry.hpp"
#include "zmesh/log.hpp"

namespace zmesh {

static const char* TAG = "registry";

CommandClassRegistry::CommandClassRegistry(uint8_t node_id, Controller& controller)
: node_id_(node_id), controller_(controller) {
}

std::shared_ptr<CommandClass> CommandClassRegistry::add(uint8_t code) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = handlers_.find(code); it != handlers_.end()) {
    return it->second;
  }
  auto handler = CommandClass::create(code, node_id_, controller_);
  if (!handler) {
    ZMESH_LOGW(TAG, "Unsupported command class %s (0x%02X) for node=%u",
               command_class_label(code), unsigned(code), unsigned(node_id_));
    return nullptr;
  }
  handlers_.emplace(code, handler);
  ZMESH_LOGD(TAG, "node=%u added %s (0x%02X)",
             unsigned(node_id_), command_class_label(code), unsigned(code));
  return handler;
}

std::shared_ptr<CommandClass> CommandClassRegistry::find(uint8_t code) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handlers_.find(code);
  return it == handlers_.end() ? nullptr : it->second;
}

bool CommandClassRegistry::remove(uint8_t code) {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.erase(code) > 0;
}

void CommandClassRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.clear();
}

size_t CommandClassRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.size();
}

std::vector<uint8_t> CommandClassRegistry::codes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint8_t> out;
  out.reserve(handlers_.size());
  for (const auto& kv : handlers_) out.push_back(kv.first);
  return out;
}

} // namespace zmesh
