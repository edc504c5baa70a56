#include "ide/tools.hpp"

#include <optional>
#include <string>

namespace revue::ide {

ToolCallResult get_diagnostics(const ReviewStateSnapshot& state, const nlohmann::json& arguments) {
  std::optional<std::string> file_filter;
  if (const auto it = arguments.find("filePath"); it != arguments.end() && it->is_string()) {
    file_filter = it->get<std::string>();
  }

  nlohmann::json diagnostics = nlohmann::json::array();
  for (const auto& entry : state.diagnostics_for(file_filter)) {
    diagnostics.push_back(Diagnostic{
        .file_path = entry.file_path,
        .range = SelectionRange{.start = Position{.line = entry.start_line, .character = 0},
                                .end = Position{.line = entry.end_line, .character = 0}},
        .message = entry.message,
        .severity = severity_from_tag(entry.severity),
        .source = std::string(kDiagnosticSource),
    });
  }
  return ToolCallResult::text(to_text(diagnostics));
}

}  // namespace revue::ide
