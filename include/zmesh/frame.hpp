/**
 * @file frame.hpp
 * @brief zmesh Frame: one length-prefixed application command for one node.
 *
 * @details
 * ## Wire layout
 * ```
 *  offset  0        1         2              3          4 ..
 *        [nodeId] [length] [commandClass] [command] [payload ...]
 *                  └── length = 2 + len(payload) ──┘
 * ```
 * The transport uses the length byte as the only delimiter, so encoder and
 * decoder must agree on it exactly. Checksums, SOF bytes and escaping belong
 * to the transport and never appear here.
 *
 * ## Transport metadata
 * A frame also carries fields that never hit the wire but tell the transport
 * how to queue it:
 *  - message class  (the transport operation, e.g. `SendData`)
 *  - message type   (request or response)
 *  - expected reply (the class the transport should wait for)
 *  - priority       (outgoing queue ordering; not interpreted by the core)
 *
 * ## Failure model
 * `decode_frame()` never throws. A bad buffer produces a `FrameStatus` other
 * than `Ok` and leaves the output frame empty; callers log and drop.
 *
 * @par Example
 * @code
 * zmesh::Frame f;
 * const uint8_t level = 0x32;
 * if (zmesh::encode_frame(zmesh::Address(5), 0x26, 0x01, &level, 1, f) == zmesh::FrameStatus::Ok) {
 *   // f.bytes() == 05 03 26 01 32
 * }
 * @endcode
 */
#ifndef ZMESH_FRAME_HPP
#define ZMESH_FRAME_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

#include "etl/vector.h"
#include "address.hpp"

namespace zmesh {

static constexpr size_t FRAME_MAX            = 255; ///< Whole encoded frame, bytes
static constexpr size_t FRAME_HEADER_LEN     = 2;   ///< nodeId + length
static constexpr size_t FRAME_MIN            = 4;   ///< header + class + command
static constexpr size_t FRAME_NODE_OFFSET    = 0;
static constexpr size_t FRAME_LENGTH_OFFSET  = 1;
static constexpr size_t FRAME_CLASS_OFFSET   = 2;
static constexpr size_t FRAME_COMMAND_OFFSET = 3;
static constexpr size_t FRAME_PAYLOAD_OFFSET = 4;
static constexpr size_t FRAME_PAYLOAD_MAX    = FRAME_MAX - FRAME_PAYLOAD_OFFSET;

using FrameBytes = etl::vector<uint8_t, FRAME_MAX>;

/// Transport operation a frame belongs to.
enum class MessageClass : uint8_t {
  None                      = 0x00,
  ApplicationCommandHandler = 0x04,
  SendData                  = 0x13,
};

enum class MessageType : uint8_t { Request = 0x00, Response = 0x01 };

/// Outgoing queue ordering, highest first.
enum class MessagePriority : uint8_t { High = 0, Set, Get, Poll, Low };

/// Result of encoding or decoding a frame.
enum class FrameStatus : uint8_t {
  Ok = 0,
  TooShort,        ///< fewer than FRAME_MIN bytes
  LengthMismatch,  ///< declared length cannot hold class + command
  Truncated,       ///< fewer bytes than the declared length
  Overflow,        ///< payload would not fit in FRAME_MAX
};

/// Non-wire metadata consumed by the transport collaborator.
struct TransportInfo {
  MessageClass    message_class{MessageClass::SendData};
  MessageType     type{MessageType::Request};
  MessageClass    expected_reply{MessageClass::None};
  MessagePriority priority{MessagePriority::Low};
};

class Frame {
public:
  Frame() = default;

  const Address& address() const { return address_; }
  uint8_t  node_id() const { return address_.node_id; }
  Endpoint endpoint() const { return address_.endpoint; }

  bool empty() const { return bytes_.empty(); }

  uint8_t length() const        { return byte_or_zero(FRAME_LENGTH_OFFSET); }
  uint8_t command_class() const { return byte_or_zero(FRAME_CLASS_OFFSET); }
  uint8_t command() const       { return byte_or_zero(FRAME_COMMAND_OFFSET); }

  /// Number of command-specific payload bytes (after the command byte).
  size_t payload_size() const;

  /// Pointer to the first payload byte, or nullptr if there is none.
  const uint8_t* payload() const;

  /**
   * @brief Read one byte at an absolute offset into the frame.
   * @return false if @p offset is past the declared frame end.
   */
  bool byte_at(size_t offset, uint8_t& out) const;

  const FrameBytes& bytes() const { return bytes_; }
  std::vector<uint8_t> to_vector() const { return std::vector<uint8_t>(bytes_.begin(), bytes_.end()); }

  const TransportInfo& transport() const { return transport_; }
  void set_transport(const TransportInfo& info) { transport_ = info; }

private:
  friend FrameStatus encode_frame(const Address&, uint8_t, uint8_t,
                                  const uint8_t*, size_t, Frame&);
  friend FrameStatus decode_frame(const uint8_t*, size_t, Endpoint, Frame&);

  uint8_t byte_or_zero(size_t offset) const {
    return offset < bytes_.size() ? bytes_[offset] : 0;
  }

  Address       address_{};
  FrameBytes    bytes_{};     ///< exactly FRAME_HEADER_LEN + length bytes
  TransportInfo transport_{};
};

/**
 * @brief Encode `[nodeId, 2+len, commandClass, command, payload...]`.
 *
 * @param to             Target node (and endpoint, kept as metadata).
 * @param command_class  Capability code.
 * @param command        Command code within that capability.
 * @param payload        Command payload; may be nullptr when @p payload_len is 0.
 * @param payload_len    Payload length in bytes.
 * @param out            Replaced on success; cleared on failure.
 * @retval FrameStatus::Ok        @p out holds the encoded frame.
 * @retval FrameStatus::Overflow  Payload longer than FRAME_PAYLOAD_MAX.
 */
FrameStatus encode_frame(const Address& to,
                         uint8_t command_class,
                         uint8_t command,
                         const uint8_t* payload,
                         size_t payload_len,
                         Frame& out);

/**
 * @brief Decode a received buffer into a frame.
 *
 * Trailing bytes after the declared length are ignored; the transport may
 * append transmit options or a callback id after the command.
 *
 * @param data      Received bytes starting at the node id.
 * @param len       Buffer length.
 * @param endpoint  Source endpoint as reported by the transport.
 * @param out       Replaced on success; cleared on failure.
 */
FrameStatus decode_frame(const uint8_t* data, size_t len, Endpoint endpoint, Frame& out);

/// Stable lowercase name for logs ("ok", "too_short", ...).
const char* frame_status_name(FrameStatus s);

/// Upper-case, space-separated hex of the wire bytes, e.g. "05 03 26 01 32".
std::string to_hex(const Frame& f);

/**
 * @brief Parse hex bytes. Accepts separators (space, ':', '-', ',') and an
 *        optional "0x" prefix per byte; "05032601" and "05 03 26 01" both work.
 * @return false on an odd digit count or a non-hex character.
 */
bool parse_hex(const std::string& text, std::vector<uint8_t>& out);

const char* message_class_name(MessageClass c);
const char* message_priority_name(MessagePriority p);

} // namespace zmesh

#endif // ZMESH_FRAME_HPP
