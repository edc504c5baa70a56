#include "ide/mcp_types.hpp"

#include <stdexcept>
#include <utility>

namespace revue::ide {

namespace {

const nlohmann::json& require_object(const std::optional<nlohmann::json>& params, const char* method) {
  if (!params.has_value()) {
    throw std::invalid_argument(std::string("Missing ") + method + " params");
  }
  if (!params->is_object()) {
    throw std::invalid_argument(std::string(method) + " params must be an object");
  }
  return *params;
}

}  // namespace

InitializeParams parse_initialize_params(const std::optional<nlohmann::json>& params) {
  const auto& object = require_object(params, "initialize");

  const auto version_it = object.find("protocolVersion");
  if (version_it == object.end() || !version_it->is_string()) {
    throw std::invalid_argument("protocolVersion must be a string");
  }

  const auto capabilities_it = object.find("capabilities");
  if (capabilities_it == object.end() || !capabilities_it->is_object()) {
    throw std::invalid_argument("capabilities must be an object");
  }

  const auto client_it = object.find("clientInfo");
  if (client_it == object.end() || !client_it->is_object()) {
    throw std::invalid_argument("clientInfo must be an object");
  }

  const auto name_it = client_it->find("name");
  if (name_it == client_it->end() || !name_it->is_string()) {
    throw std::invalid_argument("clientInfo.name must be a string");
  }

  InitializeParams parsed{.protocol_version = version_it->get<std::string>(),
                          .capabilities = *capabilities_it,
                          .client_info = ClientInfo{.name = name_it->get<std::string>(), .version = std::nullopt}};

  const auto client_version_it = client_it->find("version");
  if (client_version_it != client_it->end() && !client_version_it->is_null()) {
    if (!client_version_it->is_string()) {
      throw std::invalid_argument("clientInfo.version must be a string");
    }
    parsed.client_info.version = client_version_it->get<std::string>();
  }

  return parsed;
}

void to_json(nlohmann::json& out, const InitializeResult& result) {
  nlohmann::json server_info{{"name", result.server_info.name}};
  if (result.server_info.version.has_value()) {
    server_info["version"] = *result.server_info.version;
  }

  out = nlohmann::json{{"protocolVersion", result.protocol_version},
                       {"capabilities", {{"tools", {{"listChanged", false}}}}},
                       {"serverInfo", server_info}};
  if (result.instructions.has_value()) {
    out["instructions"] = *result.instructions;
  }
}

ToolCallParams parse_tool_call_params(const std::optional<nlohmann::json>& params) {
  const auto& object = require_object(params, "tools/call");

  const auto name_it = object.find("name");
  if (name_it == object.end() || !name_it->is_string()) {
    throw std::invalid_argument("name must be a string");
  }

  ToolCallParams parsed{.name = name_it->get<std::string>(), .arguments = nlohmann::json::object()};

  const auto args_it = object.find("arguments");
  if (args_it != object.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      throw std::invalid_argument("arguments must be an object");
    }
    parsed.arguments = *args_it;
  }

  return parsed;
}

ToolCallResult ToolCallResult::text(std::string payload) {
  return ToolCallResult{.content = {std::move(payload)}, .is_error = false};
}

ToolCallResult ToolCallResult::error(std::string payload) {
  return ToolCallResult{.content = {std::move(payload)}, .is_error = true};
}

void to_json(nlohmann::json& out, const ToolCallResult& result) {
  nlohmann::json content = nlohmann::json::array();
  for (const auto& text : result.content) {
    content.push_back({{"type", "text"}, {"text", text}});
  }

  out = nlohmann::json{{"content", content}};
  if (result.is_error) {
    out["isError"] = true;
  }
}

DiagnosticSeverity severity_from_tag(const std::string& tag) {
  if (tag == "error") {
    return DiagnosticSeverity::Error;
  }
  if (tag == "warning") {
    return DiagnosticSeverity::Warning;
  }
  if (tag == "hint") {
    return DiagnosticSeverity::Hint;
  }
  return DiagnosticSeverity::Information;
}

const char* severity_name(const DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::Error:
      return "error";
    case DiagnosticSeverity::Warning:
      return "warning";
    case DiagnosticSeverity::Hint:
      return "hint";
    case DiagnosticSeverity::Information:
      break;
  }
  return "information";
}

void to_json(nlohmann::json& out, const Position& position) {
  out = nlohmann::json{{"line", position.line}, {"character", position.character}};
}

void to_json(nlohmann::json& out, const SelectionRange& range) {
  out = nlohmann::json{{"start", range.start}, {"end", range.end}};
}

void to_json(nlohmann::json& out, const SelectionResult& result) {
  out = nlohmann::json{{"filePath", result.file_path}, {"text", result.text}, {"selection", result.selection}};
}

void to_json(nlohmann::json& out, const OpenEditor& editor) {
  out = nlohmann::json{{"filePath", editor.file_path}, {"languageId", editor.language_id}};
  if (editor.is_dirty.has_value()) {
    out["isDirty"] = *editor.is_dirty;
  }
  if (editor.is_active.has_value()) {
    out["isActive"] = *editor.is_active;
  }
}

void to_json(nlohmann::json& out, const WorkspaceFolder& folder) {
  out = nlohmann::json{{"uri", folder.uri}, {"name", folder.name}};
}

void to_json(nlohmann::json& out, const Diagnostic& diagnostic) {
  out = nlohmann::json{{"filePath", diagnostic.file_path},
                       {"range", diagnostic.range},
                       {"message", diagnostic.message},
                       {"severity", severity_name(diagnostic.severity)}};
  if (diagnostic.source.has_value()) {
    out["source"] = *diagnostic.source;
  }
}

void to_json(nlohmann::json& out, const OpenFileResult& result) {
  out = nlohmann::json{{"success", result.success}};
  if (result.error.has_value()) {
    out["error"] = *result.error;
  }
}

}  // namespace revue::ide
