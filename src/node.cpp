// -----------------------------------------------------------------------------
// node.cpp - Node endpoints
//
// API: see include/zmesh/node.hpp
// -----------------------------------------------------------------------------
#include "zmesh/node.hpp"

namespace zmesh {

Node::Node(uint8_t node_id, Controller& controller)
: node_id_(node_id), controller_(controller), registry_(node_id, controller) {
}

bool Node::add_endpoint(uint8_t endpoint) {
  if (endpoint < ENDPOINT_ID_MIN || endpoint > ENDPOINT_ID_MAX) return false;
  std::lock_guard<std::mutex> lock(endpoints_mutex_);
  endpoints_.insert(endpoint);
  return true;
}

bool Node::has_endpoint(Endpoint endpoint) const {
  if (!endpoint) return true;
  std::lock_guard<std::mutex> lock(endpoints_mutex_);
  return endpoints_.count(*endpoint) > 0;
}

std::vector<uint8_t> Node::endpoints() const {
  std::lock_guard<std::mutex> lock(endpoints_mutex_);
  return std::vector<uint8_t>(endpoints_.begin(), endpoints_.end());
}

} // namespace zmesh
