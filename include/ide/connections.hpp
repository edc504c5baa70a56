#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace revue::ide {

// Per-connection outbound channel. Full queues drop the newest message.
class OutboundQueue {
 public:
  explicit OutboundQueue(std::size_t capacity);

  bool push(std::string message);
  std::vector<std::string> take_all();

  // Pops from the front while budget remains; the last message taken may
  // overrun it. A zero budget takes nothing.
  std::vector<std::string> take_within(std::size_t byte_budget);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] std::uint64_t dropped() const;

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<std::string> messages_;
  std::uint64_t dropped_{0};
};

struct ClientConnection {
  std::string id;
  std::shared_ptr<OutboundQueue> outbound;
};

// Linear table of open connections.
class ConnectionRegistry {
 public:
  explicit ConnectionRegistry(std::size_t outbound_capacity = 32);

  ClientConnection add();
  bool remove(const std::string& id);
  void clear();

  [[nodiscard]] std::shared_ptr<OutboundQueue> find(const std::string& id) const;

  // Returns the ids whose queue accepted the message.
  std::vector<std::string> broadcast(const std::string& message);

  [[nodiscard]] std::size_t size() const;

  // Messages dropped by the queues of currently open connections.
  [[nodiscard]] std::uint64_t dropped() const;

 private:
  const std::size_t outbound_capacity_;
  mutable std::mutex mutex_;
  std::vector<ClientConnection> clients_;
  std::uint64_t next_id_{1};
};

}  // namespace revue::ide
