#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace fleet::dispatch {

/*
  In-process command channel.

  Bounded, best-effort: Publish drops the message when the queue is full
  or shut down. Nothing is persisted, so a crash loses whatever is
  queued; the provisioning requeue job covers that.

  Messages are encoded Command bytes (see CommandCodec).
*/
class CommandBus {
 public:
  explicit CommandBus(std::size_t capacity = 1024);

  // false when dropped
  bool Publish(std::string message);

  // Waits up to `timeout`. nullopt on timeout or once shut down and drained.
  std::optional<std::string> Receive(std::chrono::milliseconds timeout);

  void Shutdown();
  bool IsShutdown() const;

  std::size_t Size() const;
  std::size_t Dropped() const;

 private:
  const std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  bool                    shutdown_ = false;
  std::size_t             dropped_  = 0;
};

} // namespace fleet::dispatch
