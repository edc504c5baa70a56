#include "ide/tools.hpp"

#include <utility>

namespace revue::ide {

namespace {

nlohmann::json object_schema(nlohmann::json properties, nlohmann::json required) {
  return nlohmann::json{{"type", "object"}, {"properties", std::move(properties)}, {"required", std::move(required)}};
}

nlohmann::json no_arguments_schema() {
  return object_schema(nlohmann::json::object(), nlohmann::json::array());
}

}  // namespace

void ToolRegistry::add(Tool tool) { tools_.push_back(std::move(tool)); }

const Tool* ToolRegistry::find(const std::string& name) const {
  for (const auto& tool : tools_) {
    if (tool.name == name) {
      return &tool;
    }
  }
  return nullptr;
}

nlohmann::json ToolRegistry::list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return nlohmann::json{{"tools", tools}};
}

ToolCallResult ToolRegistry::call(const std::string& name, const nlohmann::json& arguments) const {
  const Tool* tool = find(name);
  if (tool == nullptr) {
    return ToolCallResult::error(to_text({{"error", "Unknown tool: " + name}}));
  }
  return tool->handler(arguments);
}

ToolRegistry build_tool_registry(const SharedStateStore& state, CommandBridge& commands) {
  ToolRegistry registry;

  registry.add(Tool{
      .name = "getCurrentSelection",
      .description = "Get the currently selected text in the diff viewer. Returns the file path, "
                     "selected text, and line range of the selection.",
      .input_schema = no_arguments_schema(),
      .handler = [&state](const nlohmann::json&) { return get_current_selection(*state.read()); },
  });

  registry.add(Tool{
      .name = "getOpenEditors",
      .description = "Get the list of files open in the current code review session. Each file "
                     "includes its path, language, and whether it still needs review.",
      .input_schema = no_arguments_schema(),
      .handler = [&state](const nlohmann::json&) { return get_open_editors(*state.read()); },
  });

  registry.add(Tool{
      .name = "getWorkspaceFolders",
      .description = "Get the workspace folders (repository roots) for the current review session.",
      .input_schema = no_arguments_schema(),
      .handler = [&state](const nlohmann::json&) { return get_workspace_folders(*state.read()); },
  });

  registry.add(Tool{
      .name = "getDiagnostics",
      .description = "Get review comments as diagnostics. Issue comments are reported as errors, "
                     "suggestions as warnings, notes as information and praise as hints.",
      .input_schema = object_schema(
          {{"filePath",
            {{"type", "string"},
             {"description", "Optional file path to filter diagnostics. If not provided, returns all diagnostics."}}}},
          nlohmann::json::array()),
      .handler = [&state](const nlohmann::json& arguments) { return get_diagnostics(*state.read(), arguments); },
  });

  // Mutating tool: never touches the snapshot, only queues a command.
  registry.add(Tool{
      .name = "openFile",
      .description = "Navigate to a specific file in the diff viewer. Optionally jump to a specific line.",
      .input_schema = object_schema(
          {{"filePath", {{"type", "string"}, {"description", "Path to the file to open"}}},
           {"line", {{"type", "integer"}, {"description", "Optional line number to jump to"}}}},
          nlohmann::json::array({"filePath"})),
      .handler = [&commands](const nlohmann::json& arguments) { return open_file(arguments, commands); },
  });

  return registry;
}

}  // namespace revue::ide
