#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "ide/connections.hpp"
#include "ide/discovery.hpp"
#include "ide/dispatcher.hpp"

namespace revue::ide {

class ServerError : public std::runtime_error {
 public:
  enum class Kind : std::uint8_t {
    BindFailure,
    DiscoveryFailure,
  };

  ServerError(Kind kind, const std::string& message);

  [[nodiscard]] Kind kind() const noexcept { return kind_; }

 private:
  Kind kind_;
};

struct ServerOptions {
  std::string host{"127.0.0.1"};
  std::size_t outbound_queue_capacity{32};
  // Bytes a connection may hold unwritten before outbound messages wait in
  // its queue.
  std::size_t max_buffered_bytes{1024U * 1024U};
  std::size_t max_message_bytes{16U * 1024U * 1024U};
  DiscoveryOptions discovery{};
};

// WebSocket front end for the dispatcher. All socket work and every handler
// runs on one worker thread; the discovery record lives exactly as long as
// the listener.
class Server {
 public:
  explicit Server(MethodDispatcher dispatcher, ServerOptions options = {});
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Binds an ephemeral port, writes the discovery record and starts the
  // worker. Throws ServerError; a Server can be started once.
  std::uint16_t start(const std::string& workspace_path);

  // Closes every connection, stops the worker, then drops the discovery record.
  void stop();

  // Queues a notification on every open connection.
  void broadcast_notification(const std::string& method, std::optional<nlohmann::json> params = std::nullopt);

  [[nodiscard]] std::size_t client_count() const;
  [[nodiscard]] std::uint64_t dropped_messages() const { return connections_.dropped(); }
  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
  [[nodiscard]] bool running() const noexcept { return running_; }
  [[nodiscard]] std::optional<std::filesystem::path> discovery_path() const;

 private:
  using Endpoint = websocketpp::server<websocketpp::config::asio>;
  using Handle = websocketpp::connection_hdl;

  void on_open(Handle hdl);
  void on_close(Handle hdl);
  void on_fail(Handle hdl);
  void on_message(Handle hdl, const Endpoint::message_ptr& message);
  void release(Handle hdl);
  void flush(const std::string& client_id);
  void schedule_flush(const std::string& client_id);

  MethodDispatcher dispatcher_;
  ServerOptions options_;
  Endpoint endpoint_;
  ConnectionRegistry connections_;

  // Touched only on the worker thread.
  std::map<Handle, std::string, std::owner_less<Handle>> ids_by_handle_;
  std::map<std::string, Handle> handles_by_id_;
  std::set<std::string> flush_pending_;

  std::optional<DiscoveryRecord> discovery_;
  std::thread worker_;
  std::uint16_t port_{0};
  bool started_{false};
  std::atomic<bool> running_{false};
};

}  // namespace revue::ide
