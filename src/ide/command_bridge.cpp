#include "ide/command_bridge.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace revue::ide {

const char* send_status_name(const SendStatus status) {
  switch (status) {
    case SendStatus::Queued:
      return "queued";
    case SendStatus::Full:
      return "command queue is full";
    case SendStatus::Closed:
      return "review session is no longer accepting commands";
  }
  return "unknown";
}

CommandBridge::CommandBridge(const std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("command queue capacity must be greater than 0");
  }
}

SendStatus CommandBridge::try_send(Command command) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return SendStatus::Closed;
  }
  if (queue_.size() >= capacity_) {
    return SendStatus::Full;
  }
  queue_.push_back(std::move(command));
  return SendStatus::Queued;
}

std::vector<Command> CommandBridge::drain(const std::size_t max_commands) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t count = std::min(max_commands, queue_.size());

  std::vector<Command> batch;
  batch.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    batch.push_back(std::move(queue_.front()));
    queue_.pop_front();
  }
  return batch;
}

void CommandBridge::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  queue_.clear();
}

bool CommandBridge::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t CommandBridge::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace revue::ide
