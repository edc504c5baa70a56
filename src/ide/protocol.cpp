#include "ide/protocol.hpp"

#include <utility>

namespace revue::ide {

namespace {

bool is_valid_id(const nlohmann::json& id) {
  return id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

// A null id is treated like a missing one.
std::optional<nlohmann::json> extract_id(const nlohmann::json& envelope) {
  const auto id_it = envelope.find("id");
  if (id_it == envelope.end() || id_it->is_null()) {
    return std::nullopt;
  }
  return *id_it;
}

void require_version(const nlohmann::json& envelope, const std::optional<nlohmann::json>& id) {
  const auto jsonrpc_it = envelope.find("jsonrpc");
  if (jsonrpc_it == envelope.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    throw ProtocolError(JsonRpcError::invalid_request("Expected jsonrpc version 2.0"), id);
  }
}

std::optional<nlohmann::json> extract_params(const nlohmann::json& envelope, const std::optional<nlohmann::json>& id) {
  const auto params_it = envelope.find("params");
  if (params_it == envelope.end() || params_it->is_null()) {
    return std::nullopt;
  }
  if (!params_it->is_object() && !params_it->is_array()) {
    throw ProtocolError(JsonRpcError::invalid_request("params must be an object or an array"), id);
  }
  return *params_it;
}

}  // namespace

JsonRpcError JsonRpcError::parse_error() {
  return JsonRpcError{.code = kParseError, .message = "Parse error"};
}

JsonRpcError JsonRpcError::invalid_request(const std::string& detail) {
  return JsonRpcError{.code = kInvalidRequest, .message = "Invalid request: " + detail};
}

JsonRpcError JsonRpcError::method_not_found(const std::string& method) {
  return JsonRpcError{.code = kMethodNotFound, .message = "Method not found: " + method};
}

JsonRpcError JsonRpcError::invalid_params(const std::string& detail) {
  return JsonRpcError{.code = kInvalidParams, .message = "Invalid params: " + detail};
}

JsonRpcError JsonRpcError::internal_error(const std::string& detail) {
  return JsonRpcError{.code = kInternalError, .message = "Internal error: " + detail};
}

ProtocolError::ProtocolError(JsonRpcError error, std::optional<nlohmann::json> id)
    : std::runtime_error(error.message), error_(std::move(error)), id_(std::move(id)) {}

JsonRpcResponse JsonRpcResponse::success(std::optional<nlohmann::json> id, nlohmann::json result) {
  return JsonRpcResponse{.id = std::move(id), .result = std::move(result), .error = std::nullopt};
}

JsonRpcResponse JsonRpcResponse::failure(std::optional<nlohmann::json> id, JsonRpcError error) {
  return JsonRpcResponse{.id = std::move(id), .result = std::nullopt, .error = std::move(error)};
}

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw ProtocolError(JsonRpcError::invalid_request("Request must be a JSON object"), std::nullopt);
  }

  auto id = extract_id(request);
  if (id.has_value() && !is_valid_id(*id)) {
    throw ProtocolError(JsonRpcError::invalid_request("id must be a string or an integer"), std::nullopt);
  }

  require_version(request, id);

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    throw ProtocolError(JsonRpcError::invalid_request("method must be a string"), id);
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = std::nullopt, .id = std::move(id)};
  parsed.params = extract_params(request, parsed.id);
  return parsed;
}

JsonRpcRequest decode_request(const std::string& text) {
  nlohmann::json envelope;
  try {
    envelope = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error&) {
    throw ProtocolError(JsonRpcError::parse_error(), std::nullopt);
  }
  return parse_request(envelope);
}

nlohmann::json encode_request(const JsonRpcRequest& request) {
  nlohmann::json out{{"jsonrpc", kJsonRpcVersion}, {"method", request.method}};
  if (request.id.has_value()) {
    out["id"] = *request.id;
  }
  if (request.params.has_value()) {
    out["params"] = *request.params;
  }
  return out;
}

nlohmann::json encode_error(const JsonRpcError& error) {
  nlohmann::json out{{"code", error.code}, {"message", error.message}};
  if (error.data.has_value()) {
    out["data"] = *error.data;
  }
  return out;
}

std::string to_text(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json encode_response(const JsonRpcResponse& response) {
  nlohmann::json out{{"jsonrpc", kJsonRpcVersion}, {"id", response.id.value_or(nullptr)}};
  if (response.error.has_value()) {
    out["error"] = encode_error(*response.error);
  } else {
    out["result"] = response.result.value_or(nlohmann::json::object());
  }
  return out;
}

nlohmann::json encode_notification(const JsonRpcNotification& notification) {
  nlohmann::json out{{"jsonrpc", kJsonRpcVersion}, {"method", notification.method}};
  if (notification.params.has_value()) {
    out["params"] = *notification.params;
  }
  return out;
}

JsonRpcResponse decode_response(const nlohmann::json& response) {
  if (!response.is_object()) {
    throw ProtocolError(JsonRpcError::invalid_request("Response must be a JSON object"), std::nullopt);
  }

  auto id = extract_id(response);
  require_version(response, id);

  const auto result_it = response.find("result");
  const auto error_it = response.find("error");
  const bool has_result = result_it != response.end();
  const bool has_error = error_it != response.end();
  if (has_result == has_error) {
    throw ProtocolError(JsonRpcError::invalid_request("Response must carry exactly one of result or error"), id);
  }

  if (has_result) {
    return JsonRpcResponse::success(std::move(id), *result_it);
  }

  if (!error_it->is_object()) {
    throw ProtocolError(JsonRpcError::invalid_request("error must be an object"), id);
  }
  const auto code_it = error_it->find("code");
  const auto message_it = error_it->find("message");
  if (code_it == error_it->end() || !code_it->is_number_integer() || message_it == error_it->end() ||
      !message_it->is_string()) {
    throw ProtocolError(JsonRpcError::invalid_request("error requires an integer code and a string message"), id);
  }

  JsonRpcError error{.code = code_it->get<int>(), .message = message_it->get<std::string>()};
  const auto data_it = error_it->find("data");
  if (data_it != error_it->end()) {
    error.data = *data_it;
  }
  return JsonRpcResponse::failure(std::move(id), std::move(error));
}

JsonRpcNotification decode_notification(const nlohmann::json& notification) {
  auto request = parse_request(notification);
  if (!request.is_notification()) {
    throw ProtocolError(JsonRpcError::invalid_request("Notification must not carry an id"), request.id);
  }
  return JsonRpcNotification{.method = std::move(request.method), .params = std::move(request.params)};
}

}  // namespace revue::ide
