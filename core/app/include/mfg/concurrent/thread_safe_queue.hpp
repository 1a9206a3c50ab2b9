#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace mfg {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T> - unbounded MPSC hand-off queue
// -----------------------------------------------------------------------------
//
// @brief  Mutex + condition_variable queue used to move telemetry events from
//         the threads that execute commands to the single IPC thread that
//         owns the ZeroMQ sockets.
//
// @details
// ZeroMQ sockets must only be touched by the thread that uses them. Command
// handlers publish domain events on the EventBus from whatever thread they
// run on; IpcServer's subscriber pushes a copy here and the IPC loop drains
// the queue between polls of the REP socket.
//
// The queue is unbounded. Producers are command handlers, so the rate is
// bounded by the rate of accepted commands.
//
// Thread model:
//   push()      any number of producer threads.
//   pop()       blocks until an element is available.
//   try_pop()   non-blocking.
//   drain()     takes everything queued in one lock acquisition.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // Blocks until an element is available. The caller must ensure something
  // will eventually be pushed, or it waits forever.
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });

    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Moves every queued element out, oldest first. Returns an empty deque if
  // nothing is queued.
  std::deque<T> drain() {
    std::deque<T> out;
    std::lock_guard lock(mutex_);
    out.swap(queue_);
    return out;
  }

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
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace mfg
