#include "ide/tools.hpp"

namespace revue::ide {

ToolCallResult get_open_editors(const ReviewStateSnapshot& state) {
  nlohmann::json editors = nlohmann::json::array();
  for (const auto& file : state.open_files) {
    editors.push_back(OpenEditor{
        .file_path = file.file_path,
        .language_id = file.language_id,
        .is_dirty = file.is_dirty,
        .is_active = file.is_active,
    });
  }
  return ToolCallResult::text(to_text(editors));
}

}  // namespace revue::ide
