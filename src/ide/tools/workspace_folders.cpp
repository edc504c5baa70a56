#include "ide/tools.hpp"

namespace revue::ide {

ToolCallResult get_workspace_folders(const ReviewStateSnapshot& state) {
  nlohmann::json folders = nlohmann::json::array();
  for (const auto& folder : state.workspace_folders()) {
    folders.push_back(WorkspaceFolder{.uri = "file://" + folder.path, .name = folder.name});
  }
  return ToolCallResult::text(to_text(folders));
}

}  // namespace revue::ide
