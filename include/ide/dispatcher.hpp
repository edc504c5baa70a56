#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ide/protocol.hpp"
#include "ide/tools.hpp"

namespace revue::ide {

constexpr const char* kServerName = "revue";
constexpr const char* kServerVersion = "0.4.0";

// Routes one decoded request to the handshake handlers or the tool registry.
// Holds no per-connection state, so one instance serves every connection.
class MethodDispatcher {
 public:
  explicit MethodDispatcher(ToolRegistry tools, std::string server_name = kServerName);

  // Empty for notifications and for any request without an id.
  [[nodiscard]] std::optional<JsonRpcResponse> handle(const JsonRpcRequest& request) const;

  // Decode, dispatch and encode one text frame. Envelope errors are answered
  // even when the id could not be recovered.
  [[nodiscard]] std::optional<std::string> handle_text(const std::string& text) const;

  [[nodiscard]] const ToolRegistry& tools() const noexcept { return tools_; }

 private:
  nlohmann::json handle_initialize(const std::optional<nlohmann::json>& params) const;
  nlohmann::json handle_tools_call(const std::optional<nlohmann::json>& params) const;

  ToolRegistry tools_;
  std::string server_name_;
};

}  // namespace revue::ide
