// -----------------------------------------------------------------------------
// frame.cpp - Implementation of the zmesh frame codec
//
// API & wire layout: see include/zmesh/frame.hpp
// Tests: tests/test_frame.cpp
// -----------------------------------------------------------------------------
#include "zmesh/frame.hpp"

#include <cctype>
#include <cstdio>

namespace zmesh {

// ---------- Frame accessors ----------

size_t Frame::payload_size() const {
  if (bytes_.size() <= FRAME_PAYLOAD_OFFSET) return 0;
  return bytes_.size() - FRAME_PAYLOAD_OFFSET;
}

const uint8_t* Frame::payload() const {
  return payload_size() ? &bytes_[FRAME_PAYLOAD_OFFSET] : nullptr;
}

bool Frame::byte_at(size_t offset, uint8_t& out) const {
  if (offset >= bytes_.size()) return false;
  out = bytes_[offset];
  return true;
}

// ---------- codec ----------

FrameStatus encode_frame(const Address& to,
                         uint8_t command_class,
                         uint8_t command,
                         const uint8_t* payload,
                         size_t payload_len,
                         Frame& out) {
  out = Frame{};                                   // failure leaves an empty frame
  if (payload_len > FRAME_PAYLOAD_MAX) return FrameStatus::Overflow;

  out.address_ = to;
  out.bytes_.push_back(to.node_id);
  out.bytes_.push_back(static_cast<uint8_t>(2 + payload_len)); // class + command + payload
  out.bytes_.push_back(command_class);
  out.bytes_.push_back(command);
  for (size_t i = 0; i < payload_len; ++i) {
    out.bytes_.push_back(payload[i]);
  }
  return FrameStatus::Ok;
}

FrameStatus decode_frame(const uint8_t* data, size_t len, Endpoint endpoint, Frame& out) {
  out = Frame{};
  if (!data || len < FRAME_MIN) return FrameStatus::TooShort;

  const size_t declared = data[FRAME_LENGTH_OFFSET];
  if (declared < 2) return FrameStatus::LengthMismatch;  // must cover class + command

  const size_t total = FRAME_HEADER_LEN + declared;
  if (len < total) return FrameStatus::Truncated;
  if (total > FRAME_MAX) return FrameStatus::Overflow;  // declared 254/255 never fit

  out.address_ = Address(data[FRAME_NODE_OFFSET], endpoint);
  out.bytes_.assign(data, data + total);          // trailing transport bytes dropped
  out.transport_.message_class = MessageClass::ApplicationCommandHandler;
  out.transport_.type = MessageType::Request;
  return FrameStatus::Ok;
}

const char* frame_status_name(FrameStatus s) {
  switch (s) {
    case FrameStatus::Ok:             return "ok";
    case FrameStatus::TooShort:       return "too_short";
    case FrameStatus::LengthMismatch: return "length_mismatch";
    case FrameStatus::Truncated:      return "truncated";
    case FrameStatus::Overflow:       return "overflow";
  }
  return "unknown";
}

// ---------- hex helpers (tooling) ----------

std::string to_hex(const Frame& f) {
  std::string s;
  s.reserve(f.bytes().size() * 3);
  char buf[4];
  for (size_t i = 0; i < f.bytes().size(); ++i) {
    std::snprintf(buf, sizeof(buf), "%02X", unsigned(f.bytes()[i]));
    if (i) s += ' ';
    s += buf;
  }
  return s;
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parse_hex(const std::string& text, std::vector<uint8_t>& out) {
  out.clear();
  int hi = -1;                                     // pending high nibble
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == ' ' || c == ':' || c == '-' || c == ',' || c == '\t') {
      if (hi >= 0) return false;                   // separator split a byte
      continue;
    }
    // "0x" prefix, only at a byte boundary
    if (hi < 0 && c == '0' && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
      ++i;
      continue;
    }
    const int v = hex_value(c);
    if (v < 0) return false;
    if (hi < 0) {
      hi = v;
    } else {
      out.push_back(static_cast<uint8_t>((hi << 4) | v));
      hi = -1;
    }
  }
  return hi < 0;
}

const char* message_class_name(MessageClass c) {
  switch (c) {
    case MessageClass::None:                      return "none";
    case MessageClass::ApplicationCommandHandler: return "application_command_handler";
    case MessageClass::SendData:                  return "send_data";
  }
  return "unknown";
}

const char* message_priority_name(MessagePriority p) {
  switch (p) {
    case MessagePriority::High: return "high";
    case MessagePriority::Set:  return "set";
    case MessagePriority::Get:  return "get";
    case MessagePriority::Poll: return "poll";
    case MessagePriority::Low:  return "low";
  }
  return "unknown";
}

} // namespace zmesh
