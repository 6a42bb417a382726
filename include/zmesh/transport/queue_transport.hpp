#pragma once
/**
 * @file queue_transport.hpp
 * @brief In-memory transport: a bounded FIFO of outgoing frames.
 *
 * Used by the CLI (frames are drained and printed) and by tests (frames are
 * drained and inspected). Nothing is ever put on a wire.
 */

#include <cstddef>
#include <mutex>

#include "etl/deque.h"
#include "zmesh/frame.hpp"
#include "zmesh/transport/transport_base.hpp"

namespace zmesh::transport {

class QueueTransport : public ITransport {
public:
  static constexpr std::size_t QUEUE_CAP = 16;   ///< Max frames waiting

  TxResult    enqueue(const Frame& frame) override;
  const char* name() const override { return "queue"; }

  /// Oldest frame first. @return false if empty.
  bool pop(Frame& out);

  std::size_t size() const;
  void clear();

private:
  mutable std::mutex mutex_;
  etl::deque<Frame, QUEUE_CAP> queue_;
};

} // namespace zmesh::transport
