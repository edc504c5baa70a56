#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace revue::ide {

constexpr const char* kMcpProtocolVersion = "2024-11-05";

struct ClientInfo {
  std::string name;
  std::optional<std::string> version;
};

struct InitializeParams {
  std::string protocol_version;
  nlohmann::json capabilities;
  ClientInfo client_info;
};

// Throws std::invalid_argument when a required member is missing or mistyped.
InitializeParams parse_initialize_params(const std::optional<nlohmann::json>& params);

struct ServerInfo {
  std::string name;
  std::optional<std::string> version;
};

struct InitializeResult {
  std::string protocol_version;
  ServerInfo server_info;
  std::optional<std::string> instructions;
};

void to_json(nlohmann::json& out, const InitializeResult& result);

struct ToolCallParams {
  std::string name;
  nlohmann::json arguments;
};

// Throws std::invalid_argument when `name` is missing or `arguments` is not an object.
ToolCallParams parse_tool_call_params(const std::optional<nlohmann::json>& params);

// Text-only tool result; `isError` is emitted only when set.
struct ToolCallResult {
  std::vector<std::string> content;
  bool is_error{false};

  static ToolCallResult text(std::string payload);
  static ToolCallResult error(std::string payload);
};

void to_json(nlohmann::json& out, const ToolCallResult& result);

struct Position {
  std::uint32_t line{0};
  std::uint32_t character{0};
};

struct SelectionRange {
  Position start;
  Position end;
};

struct SelectionResult {
  std::string file_path;
  std::string text;
  SelectionRange selection;
};

struct OpenEditor {
  std::string file_path;
  std::string language_id;
  std::optional<bool> is_dirty;
  std::optional<bool> is_active;
};

struct WorkspaceFolder {
  std::string uri;
  std::string name;
};

enum class DiagnosticSeverity : std::uint8_t {
  Error,
  Warning,
  Information,
  Hint,
};

DiagnosticSeverity severity_from_tag(const std::string& tag);
const char* severity_name(DiagnosticSeverity severity);

struct Diagnostic {
  std::string file_path;
  SelectionRange range;
  std::string message;
  DiagnosticSeverity severity{DiagnosticSeverity::Information};
  std::optional<std::string> source;
};

struct OpenFileResult {
  bool success{false};
  std::optional<std::string> error;
};

void to_json(nlohmann::json& out, const Position& position);
void to_json(nlohmann::json& out, const SelectionRange& range);
void to_json(nlohmann::json& out, const SelectionResult& result);
void to_json(nlohmann::json& out, const OpenEditor& editor);
void to_json(nlohmann::json& out, const WorkspaceFolder& folder);
void to_json(nlohmann::json& out, const Diagnostic& diagnostic);
void to_json(nlohmann::json& out, const OpenFileResult& result);

}  // namespace revue::ide
