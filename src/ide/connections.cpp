#include "ide/connections.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace revue::ide {

OutboundQueue::OutboundQueue(const std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("outbound queue capacity must be greater than 0");
  }
}

bool OutboundQueue::push(std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (messages_.size() >= capacity_) {
    ++dropped_;
    return false;
  }
  messages_.push_back(std::move(message));
  return true;
}

std::vector<std::string> OutboundQueue::take_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> batch(std::make_move_iterator(messages_.begin()), std::make_move_iterator(messages_.end()));
  messages_.clear();
  return batch;
}

std::vector<std::string> OutboundQueue::take_within(std::size_t byte_budget) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> batch;
  while (byte_budget > 0 && !messages_.empty()) {
    byte_budget -= std::min(byte_budget, messages_.front().size());
    batch.push_back(std::move(messages_.front()));
    messages_.pop_front();
  }
  return batch;
}

std::size_t OutboundQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_.size();
}

std::uint64_t OutboundQueue::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

ConnectionRegistry::ConnectionRegistry(const std::size_t outbound_capacity) : outbound_capacity_(outbound_capacity) {
  if (outbound_capacity_ == 0) {
    throw std::invalid_argument("outbound queue capacity must be greater than 0");
  }
}

ClientConnection ConnectionRegistry::add() {
  std::lock_guard<std::mutex> lock(mutex_);
  ClientConnection client{.id = "client-" + std::to_string(next_id_++),
                          .outbound = std::make_shared<OutboundQueue>(outbound_capacity_)};
  clients_.push_back(client);
  return client;
}

bool ConnectionRegistry::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = std::find_if(clients_.begin(), clients_.end(),
                               [&id](const ClientConnection& client) { return client.id == id; });
  if (it == clients_.end()) {
    return false;
  }
  clients_.erase(it);
  return true;
}

void ConnectionRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  clients_.clear();
}

std::shared_ptr<OutboundQueue> ConnectionRegistry::find(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& client : clients_) {
    if (client.id == id) {
      return client.outbound;
    }
  }
  return nullptr;
}

std::vector<std::string> ConnectionRegistry::broadcast(const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> delivered;
  for (const auto& client : clients_) {
    if (client.outbound->push(message)) {
      delivered.push_back(client.id);
    } else {
      std::cerr << "[ide] outbound queue full for " << client.id << ", dropping notification\n";
    }
  }
  return delivered;
}

std::size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.size();
}

std::uint64_t ConnectionRegistry::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::uint64_t total = 0;
  for (const auto& client : clients_) {
    total += client.outbound->dropped();
  }
  return total;
}

}  // namespace revue::ide
