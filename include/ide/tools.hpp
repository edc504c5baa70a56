#pragma once

#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ide/command_bridge.hpp"
#include "ide/mcp_types.hpp"
#include "ide/protocol.hpp"
#include "ide/state.hpp"

namespace revue::ide {

constexpr const char* kDiagnosticSource = "revue";

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  std::function<ToolCallResult(const nlohmann::json&)> handler;
};

class ToolRegistry {
 public:
  void add(Tool tool);

  [[nodiscard]] const Tool* find(const std::string& name) const;
  [[nodiscard]] const std::vector<Tool>& tools() const noexcept { return tools_; }

  // `tools/list` payload, in registration order.
  [[nodiscard]] nlohmann::json list() const;

  // Unknown names come back as a tool-level error, not an exception.
  [[nodiscard]] ToolCallResult call(const std::string& name, const nlohmann::json& arguments) const;

 private:
  std::vector<Tool> tools_;
};

ToolRegistry build_tool_registry(const SharedStateStore& state, CommandBridge& commands);

ToolCallResult get_current_selection(const ReviewStateSnapshot& state);
ToolCallResult get_open_editors(const ReviewStateSnapshot& state);
ToolCallResult get_workspace_folders(const ReviewStateSnapshot& state);
ToolCallResult get_diagnostics(const ReviewStateSnapshot& state, const nlohmann::json& arguments);
ToolCallResult open_file(const nlohmann::json& arguments, CommandBridge& commands);

}  // namespace revue::ide
