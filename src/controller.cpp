// -----------------------------------------------------------------------------
// controller.cpp - Node table, inbound routing, read-backs
//
// API & failure model: see include/zmesh/controller.hpp
// Tests: tests/test_controller.cpp, tests/test_concurrency.cpp
// -----------------------------------------------------------------------------
#include "zmesh/controller.hpp"
#include "zmesh/log.hpp"

namespace zmesh {

static const char* TAG = "controller";

const char* dispatch_status_name(DispatchStatus s) {
  switch (s) {
    case DispatchStatus::Ok:                      return "ok";
    case DispatchStatus::Malformed:               return "malformed";
    case DispatchStatus::UnknownNode:             return "unknown_node";
    case DispatchStatus::UnsupportedCommandClass: return "unsupported_command_class";
  }
  return "unknown";
}

Controller::Controller(transport::ITransport& transport)
: transport_(transport) {
}

// ---------- node table ----------

std::shared_ptr<Node> Controller::add_node(uint8_t node_id) {
  if (node_id < NODE_ID_MIN || node_id > NODE_ID_MAX) {
    ZMESH_LOGW(TAG, "node id %u out of range %u..%u",
               unsigned(node_id), unsigned(NODE_ID_MIN), unsigned(NODE_ID_MAX));
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(nodes_mutex_);
  auto& slot = nodes_[node_id];
  if (!slot) {
    slot = std::make_shared<Node>(node_id, *this);
    ZMESH_LOGI(TAG, "node=%u added", unsigned(node_id));
  }
  return slot;
}

bool Controller::remove_node(uint8_t node_id) {
  std::shared_ptr<Node> node;
  {
    std::lock_guard<std::mutex> lock(nodes_mutex_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) return false;
    node = std::move(it->second);
    nodes_.erase(it);
  }
  // handlers still in use elsewhere stay alive through their shared_ptr
  node->command_classes().clear();
  ZMESH_LOGI(TAG, "node=%u removed", unsigned(node_id));
  return true;
}

std::shared_ptr<Node> Controller::get_node(uint8_t node_id) const {
  std::lock_guard<std::mutex> lock(nodes_mutex_);
  auto it = nodes_.find(node_id);
  return it == nodes_.end() ? nullptr : it->second;
}

size_t Controller::node_count() const {
  std::lock_guard<std::mutex> lock(nodes_mutex_);
  return nodes_.size();
}

std::vector<uint8_t> Controller::node_ids() const {
  std::lock_guard<std::mutex> lock(nodes_mutex_);
  std::vector<uint8_t> out;
  out.reserve(nodes_.size());
  for (const auto& kv : nodes_) out.push_back(kv.first);
  return out;
}

// ---------- inbound ----------

DispatchStatus Controller::handle_incoming(const uint8_t* data, size_t len, Endpoint endpoint) {
  Frame frame;
  const FrameStatus st = decode_frame(data, len, endpoint, frame);
  if (st != FrameStatus::Ok) {
    ZMESH_LOGW(TAG, "dropping malformed frame len=%u reason=%s",
               unsigned(len), frame_status_name(st));
    return DispatchStatus::Malformed;
  }
  return handle_incoming(frame);
}

DispatchStatus Controller::handle_incoming(const Frame& frame) {
  if (frame.empty()) {
    ZMESH_LOGW(TAG, "dropping empty frame");
    return DispatchStatus::Malformed;
  }

  auto node = get_node(frame.node_id());
  if (!node) {
    ZMESH_LOGW(TAG, "frame for unknown node=%u dropped", unsigned(frame.node_id()));
    return DispatchStatus::UnknownNode;
  }

  const uint8_t cc = frame.command_class();
  auto handler = node->get_command_class(cc);
  if (!handler) {
    ZMESH_LOGW(TAG, "Unsupported command class %s (0x%02X) for node=%u",
               command_class_label(cc), unsigned(cc), unsigned(frame.node_id()));
    return DispatchStatus::UnsupportedCommandClass;
  }

  ZMESH_LOGD(TAG, "node=%u endpoint=%u class=%s command=0x%02X",
             unsigned(frame.node_id()), endpoint_number(frame.endpoint()),
             handler->label(), unsigned(frame.command()));
  handler->handle_application_command(frame.command(), FRAME_PAYLOAD_OFFSET,
                                      frame.endpoint(), frame);
  return DispatchStatus::Ok;
}

// ---------- outbound ----------

bool Controller::request_value(uint8_t node_id, Endpoint endpoint) {
  auto node = get_node(node_id);
  if (!node) {
    ZMESH_LOGW(TAG, "read-back for unknown node=%u", unsigned(node_id));
    return false;
  }

  for (uint8_t code : node->command_classes().codes()) {
    auto handler = node->get_command_class(code);
    if (!handler) continue;                       // removed meanwhile
    BasicCommands* basic = handler->basic_commands();
    if (!basic) continue;

    return send_read_back(*basic, endpoint);
  }

  ZMESH_LOGW(TAG, "node=%u has no command class able to read back a value", unsigned(node_id));
  return false;
}

bool Controller::request_value(uint8_t node_id, uint8_t command_class, Endpoint endpoint) {
  auto node = get_node(node_id);
  if (!node) {
    ZMESH_LOGW(TAG, "read-back for unknown node=%u", unsigned(node_id));
    return false;
  }
  auto handler = node->get_command_class(command_class);
  BasicCommands* basic = handler ? handler->basic_commands() : nullptr;
  if (!basic) {
    ZMESH_LOGW(TAG, "node=%u command class %s (0x%02X) cannot read back a value",
               unsigned(node_id), command_class_label(command_class), unsigned(command_class));
    return false;
  }
  return send_read_back(*basic, endpoint);
}

bool Controller::send_read_back(BasicCommands& basic, Endpoint endpoint) {
  const Frame frame = basic.get_value_message(endpoint);
  if (frame.empty()) return false;
  return send(frame) == transport::TxResult::Ok;
}

transport::TxResult Controller::send(const Frame& frame) {
  const transport::TxResult r = transport_.enqueue(frame);
  if (r != transport::TxResult::Ok) {
    ZMESH_LOGW(TAG, "transport %s refused frame node=%u reason=%s",
               transport_.name(), unsigned(frame.node_id()), transport::tx_result_name(r));
  } else {
    ZMESH_LOGT(TAG, "enqueued node=%u prio=%s bytes=%s", unsigned(frame.node_id()),
               message_priority_name(frame.transport().priority), to_hex(frame).c_str());
  }
  return r;
}

} // namespace zmesh
