#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace revue::ide {

struct OpenFileCommand {
  std::string path;
  std::optional<std::uint32_t> line;
};

// Actions a tool call asks the host loop to perform.
using Command = std::variant<OpenFileCommand>;

enum class SendStatus : std::uint8_t {
  Queued,
  Full,
  Closed,
};

const char* send_status_name(SendStatus status);

// Bounded FIFO from tool handlers (network worker) to the host loop.
// Producers never block; the host drains a capped batch once per frame.
class CommandBridge {
 public:
  explicit CommandBridge(std::size_t capacity = 32);

  CommandBridge(const CommandBridge&) = delete;
  CommandBridge& operator=(const CommandBridge&) = delete;

  SendStatus try_send(Command command);

  std::vector<Command> drain(std::size_t max_commands);

  // Host loop has exited: pending commands are dropped, later sends fail.
  void close();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] std::size_t pending() const;
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<Command> queue_;
  bool closed_{false};
};

}  // namespace revue::ide
