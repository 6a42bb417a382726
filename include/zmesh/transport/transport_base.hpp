#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal, core-agnostic hand-off interface between zmesh and a link layer.
 *
 * The core never talks to a serial port or radio. It builds frames and hands
 * them to an `ITransport`, which owns queuing, SOF/checksum framing, ACK
 * timing and retries.
 */

#include <cstddef>
#include <cstdint>

namespace zmesh {
class Frame;
}

namespace zmesh::transport {

// Return codes kept simple so they can be logged as integers.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };

inline const char* tx_result_name(TxResult r) {
  switch (r) {
    case TxResult::Ok:    return "ok";
    case TxResult::Busy:  return "busy";
    case TxResult::Error: return "error";
  }
  return "unknown";
}

/**
 * @brief Transport trait the controller relies on.
 *
 * Contract:
 *  - enqueue(frame) copies the frame into the outgoing queue and returns at
 *    once; it never blocks waiting for the link. A full queue is `Busy`.
 *  - Frames carry their priority and expected reply in `Frame::transport()`;
 *    ordering and reply matching are the transport's business.
 *  - name() is a short identifier for logs/diagnostics.
 *  - Implementations must accept calls from several threads.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual TxResult    enqueue(const Frame& frame) = 0;
  virtual const char* name() const = 0;
};

} // namespace zmesh::transport
