#include "command_bus.hpp"

namespace fleet::dispatch {

CommandBus::CommandBus(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool CommandBus::Publish(std::string message) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) {
      ++dropped_;
      return false;
    }
    queue_.push_back(std::move(message));
  }
  cv_.notify_one();
  return true;
}

std::optional<std::string> CommandBus::Receive(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  std::string message = std::move(queue_.front());
  queue_.pop_front();
  return message;
}

void CommandBus::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool CommandBus::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

std::size_t CommandBus::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::size_t CommandBus::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace fleet::dispatch
