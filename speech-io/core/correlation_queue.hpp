//
//  correlation_queue.hpp
//  speech-io
//

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include "speech-io/core/metadata.hpp"

namespace sio {

namespace core {

// FIFO of metadata records, one per logical unit that has been submitted but
// not yet picked up by the result path. The service replies without request
// ids, so arrival order is the only thing linking a reply to its request.
class CorrelationQueue {
 public:
  CorrelationQueue() = default;

  void enqueue(const Metadata& meta);

  void enqueue(Metadata&& meta);

  // empty optional when nothing is pending
  std::optional<Metadata> dequeue();

  void clear();

  inline std::size_t size() const { return entries_.size(); }

  inline bool empty() const { return entries_.empty(); }

  inline uint64_t total_enqueued() const { return total_enqueued_; }

 private:
  std::deque<Metadata> entries_;
  uint64_t total_enqueued_ = 0;
};

} // core

} // sio
