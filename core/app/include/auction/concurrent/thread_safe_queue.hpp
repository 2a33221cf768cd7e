#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace auction {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO queue that multiple threads can push to and pop from
// without data races. Optionally bounded: with a non-zero capacity, try_push()
// refuses new items instead of growing, which is how room mailboxes and
// per-subscriber outbound buffers stay bounded.
//
// Why in architecture: Used at every thread boundary. Room operations are
// posted into a shard's mailbox; accepted events are pushed into each
// subscriber's outbound queue; telemetry and persistence records cross to
// their worker threads the same way. No shared mutable state beyond the
// queue itself.
//
// Closing: close() wakes every blocked consumer. Items already queued can
// still be popped; after the queue is drained, pop_for() returns nullopt
// immediately. try_push() on a closed queue returns false.
//
// Thread model: Safe for multiple producers and multiple consumers. All
// methods are thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  // capacity == 0 means unbounded.
  explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  // Non-copyable, non-movable: owns a mutex and condition_variable. Share by
  // reference or pointer.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item regardless of capacity and closed state. Used by
  // producers that must never lose an item (e.g. telemetry of an event that
  // has already been broadcast).
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer does not immediately
    // block on the same mutex.
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // try_push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item only if the queue is open and below capacity.
  // Never blocks. This is the only push used on paths that must not be
  // slowed down by a consumer (room fan-out, room mailboxes).
  // Output: true if the item was queued, false if full or closed (the value
  // is dropped).
  // -------------------------------------------------------------------------
  bool try_push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_ || (capacity_ != 0 && queue_.size() >= capacity_)) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting until one is available.
  // Must not be used on a queue that may be closed while empty; use
  // pop_for() there.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout)
  // -------------------------------------------------------------------------
  // What: Waits up to `timeout` for an item. Returns nullopt on timeout, or
  // immediately once the queue is closed and drained.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    condition_.wait_for(lock, timeout,
                        [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
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

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // What: Marks the queue closed and wakes all waiters. Idempotent.
  // Output: true only for the call that actually closed the queue.
  // -------------------------------------------------------------------------
  bool close() {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      closed_ = true;
    }
    condition_.notify_all();
    return true;
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
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

  std::size_t capacity() const { return capacity_; }

 private:
  // Protects queue_ and closed_. mutable so const observers can lock.
  mutable std::mutex mutex_;

  // Signalled on every push and on close().
  std::condition_variable condition_;

  std::deque<T> queue_;
  const std::size_t capacity_;
  bool closed_{false};
};

}  // namespace auction
