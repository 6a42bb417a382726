/**
 * @file address.hpp
 * @brief zmesh Address: who a frame is for: a node, and optionally one of its endpoints.
 *
 * @details
 * Nodes are small integers handed out by the controller at inclusion time
 * (1..232). Multi-channel devices expose sub-devices called endpoints
 * (1..127). An empty endpoint means the node's root device.
 *
 * An `Address` carries no behavior beyond equality and hashing; it is the key
 * used for per-node state and is copied into every frame that names it.
 */
#ifndef ZMESH_ADDRESS_HPP
#define ZMESH_ADDRESS_HPP

#include <stdint.h>
#include <cstddef>
#include <functional>
#include <optional>

namespace zmesh {

/// Sub-device selector. `std::nullopt` addresses the root device.
using Endpoint = std::optional<uint8_t>;

/// The root device of a node.
inline constexpr Endpoint kRootEndpoint = std::nullopt;

static constexpr uint8_t NODE_ID_MIN     = 1;
static constexpr uint8_t NODE_ID_MAX     = 232;
static constexpr uint8_t ENDPOINT_ID_MIN = 1;
static constexpr uint8_t ENDPOINT_ID_MAX = 127;

struct Address {
  uint8_t  node_id{0};
  Endpoint endpoint{kRootEndpoint};

  Address() = default;
  explicit Address(uint8_t node, Endpoint ep = kRootEndpoint)
  : node_id(node), endpoint(ep) {}

  bool is_root() const { return !endpoint.has_value(); }
};

inline bool operator==(const Address& a, const Address& b) {
  return a.node_id == b.node_id && a.endpoint == b.endpoint;
}

inline bool operator!=(const Address& a, const Address& b) {
  return !(a == b);
}

/// Endpoint as a printable integer; the root device prints as 0.
inline unsigned endpoint_number(Endpoint ep) {
  return ep ? unsigned(*ep) : 0u;
}

} // namespace zmesh

namespace std {
template <>
struct hash<zmesh::Address> {
  size_t operator()(const zmesh::Address& a) const noexcept {
    // node in the low byte, endpoint+1 (0 for root) above it
    const size_t ep = a.endpoint ? size_t(*a.endpoint) + 1 : 0;
    return std::hash<size_t>{}(size_t(a.node_id) | (ep << 8));
  }
};
} // namespace std

#endif // ZMESH_ADDRESS_HPP
