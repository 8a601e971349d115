//
//  correlation_queue.cpp
//  speech-io
//

#include <utility>
#include "speech-io/core/correlation_queue.hpp"

using namespace sio::core;

void CorrelationQueue::enqueue(const Metadata& meta) {
  entries_.push_back(meta);
  ++total_enqueued_;
}

void CorrelationQueue::enqueue(Metadata&& meta) {
  entries_.push_back(std::move(meta));
  ++total_enqueued_;
}

std::optional<Metadata> CorrelationQueue::dequeue() {
  if (entries_.empty()) {
    return std::nullopt;
  }

  auto meta = std::move(entries_.front());
  entries_.pop_front();
  return meta;
}

void CorrelationQueue::clear() {
  entries_.clear();
}
