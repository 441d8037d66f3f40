#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace copytrader {

// -----------------------------------------------------------------------------
// BoundedQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: FIFO between a producer that must never block and a
// polling consumer that may fall behind. The session pushes telemetry under
// its own lock; the IPC worker drains it every poll cycle.
//
// Overflow policy: when full, push() evicts the OLDEST item. Telemetry is a
// stream of snapshots, so the newest state is the one worth keeping.
// Evictions are counted in dropped().
//
// Thread model: Safe for any number of producers and consumers. Nothing
// blocks beyond the internal mutex.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("BoundedQueue capacity must be > 0");
    }
  }

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  // Appends one item, evicting the oldest if the queue is at capacity.
  void push(T value) {
    std::lock_guard lock(mutex_);
    if (items_.size() == capacity_) {
      items_.pop_front();
      ++dropped_;
    }
    items_.push_back(std::move(value));
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  // Takes everything queued so far in one lock acquisition, oldest first.
  std::vector<T> drain() {
    std::lock_guard lock(mutex_);
    std::vector<T> out;
    out.reserve(items_.size());
    for (auto& item : items_) {
      out.push_back(std::move(item));
    }
    items_.clear();
    return out;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

  bool empty() const { return size() == 0; }

  std::size_t capacity() const { return capacity_; }

  // Total evictions since construction.
  std::uint64_t dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<T> items_;
  std::uint64_t dropped_{0};
};

}  // namespace copytrader
