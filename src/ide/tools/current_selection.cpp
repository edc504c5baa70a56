#include "ide/tools.hpp"

namespace revue::ide {

ToolCallResult get_current_selection(const ReviewStateSnapshot& state) {
  if (!state.selection.has_value()) {
    return ToolCallResult::text(
        to_text({{"error", "No selection"}, {"message", "No text is currently selected in the diff viewer"}}));
  }

  const auto& selection = *state.selection;
  const SelectionResult result{
      .file_path = selection.file_path,
      .text = selection.text,
      .selection = SelectionRange{.start = Position{.line = selection.start_line, .character = 0},
                                  .end = Position{.line = selection.end_line, .character = 0}},
  };
  return ToolCallResult::text(to_text(result));
}

}  // namespace revue::ide
