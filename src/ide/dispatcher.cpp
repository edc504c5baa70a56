#include "ide/dispatcher.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "ide/mcp_types.hpp"

namespace revue::ide {

namespace {

constexpr const char* kInstructions =
    "revue is a terminal code review tool. You can query the current selection, open files, workspace, "
    "and review comments (diagnostics). Use openFile to navigate to specific files in the diff viewer.";

}  // namespace

MethodDispatcher::MethodDispatcher(ToolRegistry tools, std::string server_name)
    : tools_(std::move(tools)), server_name_(std::move(server_name)) {}

std::optional<JsonRpcResponse> MethodDispatcher::handle(const JsonRpcRequest& request) const {
  const bool should_respond = !request.is_notification();
  const auto& method = request.method;

  try {
    nlohmann::json result;
    if (method == "initialize") {
      result = handle_initialize(request.params);
    } else if (method == "initialized" || method == "notifications/cancelled") {
      return std::nullopt;
    } else if (method == "ping") {
      result = nlohmann::json::object();
    } else if (method == "tools/list") {
      result = tools_.list();
    } else if (method == "tools/call") {
      result = handle_tools_call(request.params);
    } else {
      if (!should_respond) {
        return std::nullopt;
      }
      return JsonRpcResponse::failure(request.id, JsonRpcError::method_not_found(method));
    }

    if (!should_respond) {
      return std::nullopt;
    }
    return JsonRpcResponse::success(request.id, std::move(result));
  } catch (const std::invalid_argument& ex) {
    if (!should_respond) {
      return std::nullopt;
    }
    return JsonRpcResponse::failure(request.id, JsonRpcError::invalid_params(ex.what()));
  } catch (const std::exception& ex) {
    std::cerr << "[ide] " << method << " failed: " << ex.what() << '\n';
    if (!should_respond) {
      return std::nullopt;
    }
    return JsonRpcResponse::failure(request.id, JsonRpcError::internal_error(ex.what()));
  }
}

std::optional<std::string> MethodDispatcher::handle_text(const std::string& text) const {
  JsonRpcRequest request;
  try {
    request = decode_request(text);
  } catch (const ProtocolError& ex) {
    return to_text(encode_response(JsonRpcResponse::failure(ex.id(), ex.error())));
  }

  const auto response = handle(request);
  if (!response.has_value()) {
    return std::nullopt;
  }
  return to_text(encode_response(*response));
}

nlohmann::json MethodDispatcher::handle_initialize(const std::optional<nlohmann::json>& params) const {
  const auto parsed = parse_initialize_params(params);
  std::cerr << "[ide] initialize from " << parsed.client_info.name << " (protocol " << parsed.protocol_version
            << ")\n";

  return InitializeResult{
      .protocol_version = kMcpProtocolVersion,
      .server_info = ServerInfo{.name = server_name_, .version = kServerVersion},
      .instructions = kInstructions,
  };
}

nlohmann::json MethodDispatcher::handle_tools_call(const std::optional<nlohmann::json>& params) const {
  const auto parsed = parse_tool_call_params(params);
  return tools_.call(parsed.name, parsed.arguments);
}

}  // namespace revue::ide
