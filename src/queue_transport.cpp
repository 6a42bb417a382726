// -----------------------------------------------------------------------------
// queue_transport.cpp - Bounded in-memory outgoing queue
//
// API: see include/zmesh/transport/queue_transport.hpp
// -----------------------------------------------------------------------------
#include "zmesh/transport/queue_transport.hpp"

namespace zmesh::transport {

TxResult QueueTransport::enqueue(const Frame& frame) {
  if (frame.empty()) return TxResult::Error;
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.full()) return TxResult::Busy;
  queue_.push_back(frame);
  return TxResult::Ok;
}

bool QueueTransport::pop(Frame& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) return false;
  out = queue_.front();
  queue_.pop_front();
  return true;
}

std::size_t QueueTransport::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void QueueTransport::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.clear();
}

} // namespace zmesh::transport
