#include "ide/server.hpp"

#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

namespace revue::ide {

namespace {

constexpr auto kCloseGracePeriod = std::chrono::milliseconds(500);
constexpr auto kClosePollInterval = std::chrono::milliseconds(10);
constexpr long kFlushRetryMs = 20;

}  // namespace

ServerError::ServerError(const Kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

Server::Server(MethodDispatcher dispatcher, ServerOptions options)
    : dispatcher_(std::move(dispatcher)),
      options_(std::move(options)),
      connections_(options_.outbound_queue_capacity) {
  endpoint_.clear_access_channels(websocketpp::log::alevel::all);
  endpoint_.clear_error_channels(websocketpp::log::elevel::all);
  endpoint_.set_max_message_size(options_.max_message_bytes);

  endpoint_.set_open_handler([this](Handle hdl) { on_open(std::move(hdl)); });
  endpoint_.set_close_handler([this](Handle hdl) { on_close(std::move(hdl)); });
  endpoint_.set_fail_handler([this](Handle hdl) { on_fail(std::move(hdl)); });
  endpoint_.set_message_handler(
      [this](Handle hdl, const Endpoint::message_ptr& message) { on_message(std::move(hdl), message); });
  // Returning true lets the endpoint answer with a pong carrying the same payload.
  endpoint_.set_ping_handler([](Handle, const std::string&) { return true; });
}

Server::~Server() { stop(); }

std::uint16_t Server::start(const std::string& workspace_path) {
  if (started_) {
    throw ServerError(ServerError::Kind::BindFailure, "server has already been started");
  }
  started_ = true;

  websocketpp::lib::error_code ec;
  endpoint_.init_asio(ec);
  if (ec) {
    throw ServerError(ServerError::Kind::BindFailure, "failed to initialise transport: " + ec.message());
  }

  endpoint_.listen(options_.host, "0", ec);
  if (ec) {
    throw ServerError(ServerError::Kind::BindFailure, "failed to bind " + options_.host + ": " + ec.message());
  }

  websocketpp::lib::asio::error_code endpoint_ec;
  const auto local = endpoint_.get_local_endpoint(endpoint_ec);
  if (endpoint_ec) {
    endpoint_.stop_listening(ec);
    throw ServerError(ServerError::Kind::BindFailure, "failed to read bound port: " + endpoint_ec.message());
  }
  port_ = local.port();

  endpoint_.start_accept(ec);
  if (ec) {
    endpoint_.stop_listening(ec);
    throw ServerError(ServerError::Kind::BindFailure, "failed to start accepting: " + ec.message());
  }

  try {
    discovery_.emplace(DiscoveryRecord::create(port_, workspace_path, options_.discovery));
  } catch (const DiscoveryError& ex) {
    endpoint_.stop_listening(ec);
    throw ServerError(ServerError::Kind::DiscoveryFailure, ex.what());
  }

  worker_ = std::thread([this] {
    try {
      endpoint_.run();
    } catch (const std::exception& ex) {
      std::cerr << "[ide] transport worker stopped: " << ex.what() << '\n';
    }
  });
  running_ = true;

  std::cerr << "[ide] listening on ws://" << options_.host << ':' << port_ << '\n';
  return port_;
}

void Server::stop() {
  if (!running_) {
    discovery_.reset();
    return;
  }
  running_ = false;

  endpoint_.get_io_service().post([this] {
    websocketpp::lib::error_code close_ec;
    endpoint_.stop_listening(close_ec);
    const auto open_connections = ids_by_handle_;
    for (const auto& [hdl, id] : open_connections) {
      endpoint_.close(hdl, websocketpp::close::status::going_away, "server shutting down", close_ec);
      if (close_ec) {
        std::cerr << "[ide] failed to close " << id << ": " << close_ec.message() << '\n';
      }
    }
  });

  const auto deadline = std::chrono::steady_clock::now() + kCloseGracePeriod;
  while (connections_.size() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kClosePollInterval);
  }

  endpoint_.stop();
  if (worker_.joinable()) {
    worker_.join();
  }

  ids_by_handle_.clear();
  handles_by_id_.clear();
  flush_pending_.clear();
  connections_.clear();

  if (discovery_.has_value()) {
    try {
      discovery_->remove();
    } catch (const DiscoveryError& ex) {
      std::cerr << "[discovery] " << ex.what() << '\n';
    }
    discovery_.reset();
  }
  std::cerr << "[ide] server stopped\n";
}

void Server::broadcast_notification(const std::string& method, std::optional<nlohmann::json> params) {
  if (!running_) {
    return;
  }
  const auto payload =
      to_text(encode_notification(JsonRpcNotification{.method = method, .params = std::move(params)}));
  const auto delivered = connections_.broadcast(payload);

  endpoint_.get_io_service().post([this, delivered] {
    for (const auto& id : delivered) {
      flush(id);
    }
  });
}

std::size_t Server::client_count() const { return connections_.size(); }

std::optional<std::filesystem::path> Server::discovery_path() const {
  if (!discovery_.has_value()) {
    return std::nullopt;
  }
  return discovery_->path();
}

void Server::on_open(Handle hdl) {
  const auto client = connections_.add();
  ids_by_handle_[hdl] = client.id;
  handles_by_id_[client.id] = hdl;
  std::cerr << "[ide] " << client.id << " connected\n";
}

void Server::on_close(Handle hdl) { release(std::move(hdl)); }

void Server::on_fail(Handle hdl) {
  websocketpp::lib::error_code ec;
  const auto connection = endpoint_.get_con_from_hdl(hdl, ec);
  if (!ec) {
    std::cerr << "[ide] connection failed: " << connection->get_ec().message() << '\n';
  }
  release(std::move(hdl));
}

void Server::release(Handle hdl) {
  const auto it = ids_by_handle_.find(hdl);
  if (it == ids_by_handle_.end()) {
    return;
  }
  const std::string id = it->second;
  ids_by_handle_.erase(it);
  handles_by_id_.erase(id);
  connections_.remove(id);
  std::cerr << "[ide] " << id << " disconnected\n";
}

void Server::on_message(Handle hdl, const Endpoint::message_ptr& message) {
  if (message->get_opcode() != websocketpp::frame::opcode::text) {
    return;
  }

  const auto it = ids_by_handle_.find(hdl);
  if (it == ids_by_handle_.end()) {
    return;
  }
  const std::string id = it->second;

  const auto response = dispatcher_.handle_text(message->get_payload());
  if (!response.has_value()) {
    return;
  }

  const auto outbound = connections_.find(id);
  if (outbound == nullptr) {
    return;
  }
  if (!outbound->push(*response)) {
    std::cerr << "[ide] outbound queue full for " << id << ", dropping response\n";
    return;
  }
  flush(id);
}

void Server::flush(const std::string& client_id) {
  const auto handle_it = handles_by_id_.find(client_id);
  const auto outbound = connections_.find(client_id);
  if (handle_it == handles_by_id_.end() || outbound == nullptr) {
    return;
  }

  websocketpp::lib::error_code ec;
  const auto connection = endpoint_.get_con_from_hdl(handle_it->second, ec);
  if (ec) {
    return;
  }

  // Messages stay queued while the socket has a backlog, so the queue
  // capacity bounds what a slow reader can pin in memory.
  const auto buffered = connection->get_buffered_amount();
  const auto budget = buffered >= options_.max_buffered_bytes ? 0 : options_.max_buffered_bytes - buffered;
  for (const auto& payload : outbound->take_within(budget)) {
    const auto send_ec = connection->send(payload, websocketpp::frame::opcode::text);
    if (send_ec) {
      std::cerr << "[ide] send to " << client_id << " failed: " << send_ec.message() << '\n';
      return;
    }
  }

  if (outbound->size() > 0) {
    schedule_flush(client_id);
  }
}

void Server::schedule_flush(const std::string& client_id) {
  if (!flush_pending_.insert(client_id).second) {
    return;
  }
  endpoint_.set_timer(kFlushRetryMs, [this, client_id](const websocketpp::lib::error_code& ec) {
    flush_pending_.erase(client_id);
    if (ec) {
      return;
    }
    flush(client_id);
  });
}

}  // namespace revue::ide
