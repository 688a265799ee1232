#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace autotrader {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO queue that one thread pushes to while another drains
// it, without data races.
//
// Why in architecture: Used at the boundary between the orchestrator thread
// and the control server thread. The orchestrator pushes telemetry events
// and never waits on network I/O; the server thread drains the queue and
// does the JSON serialization and socket writes.
//
// Thread model: Safe for multiple producers and multiple consumers. Every
// method takes the internal mutex for a short critical section; nothing
// blocks waiting for items.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item to the back of the queue.
  // Thread-safety: Safe to call from any thread.
  // Input: value is taken by value so callers can std::move into the queue.
  // -------------------------------------------------------------------------
  void push(T value) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(value));
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, or std::nullopt when empty.
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may push or pop immediately after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::deque<T> queue_;
};

}  // namespace autotrader
