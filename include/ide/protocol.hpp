#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace revue::ide {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

struct JsonRpcError {
  int code;
  std::string message;
  std::optional<nlohmann::json> data{};

  static JsonRpcError parse_error();
  static JsonRpcError invalid_request(const std::string& detail);
  static JsonRpcError method_not_found(const std::string& method);
  static JsonRpcError invalid_params(const std::string& detail);
  static JsonRpcError internal_error(const std::string& detail);
};

// Raised while decoding an inbound envelope. Carries the id when it could be
// recovered so the error response can still be correlated.
class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(JsonRpcError error, std::optional<nlohmann::json> id);

  [[nodiscard]] const JsonRpcError& error() const noexcept { return error_; }
  [[nodiscard]] const std::optional<nlohmann::json>& id() const noexcept { return id_; }

 private:
  JsonRpcError error_;
  std::optional<nlohmann::json> id_;
};

// An absent id marks a notification: no response is ever produced for it.
struct JsonRpcRequest {
  std::string method;
  std::optional<nlohmann::json> params;
  std::optional<nlohmann::json> id;

  [[nodiscard]] bool is_notification() const noexcept { return !id.has_value(); }
};

struct JsonRpcResponse {
  std::optional<nlohmann::json> id;
  std::optional<nlohmann::json> result;
  std::optional<JsonRpcError> error;

  static JsonRpcResponse success(std::optional<nlohmann::json> id, nlohmann::json result);
  static JsonRpcResponse failure(std::optional<nlohmann::json> id, JsonRpcError error);
};

struct JsonRpcNotification {
  std::string method;
  std::optional<nlohmann::json> params;
};

JsonRpcRequest parse_request(const nlohmann::json& request);
JsonRpcRequest decode_request(const std::string& text);

nlohmann::json encode_request(const JsonRpcRequest& request);
nlohmann::json encode_response(const JsonRpcResponse& response);
nlohmann::json encode_notification(const JsonRpcNotification& notification);
nlohmann::json encode_error(const JsonRpcError& error);

// Serializes for the wire. Invalid UTF-8 in strings becomes U+FFFD instead of throwing.
std::string to_text(const nlohmann::json& value);

JsonRpcResponse decode_response(const nlohmann::json& response);
JsonRpcNotification decode_notification(const nlohmann::json& notification);

}  // namespace revue::ide
