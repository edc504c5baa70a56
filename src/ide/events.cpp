#include "ide/events.hpp"

#include <type_traits>
#include <utility>
#include <variant>

#include "ide/mcp_types.hpp"

namespace revue::ide {

JsonRpcNotification to_notification(const IdeEvent& event) {
  return std::visit(
      [](const auto& value) -> JsonRpcNotification {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, SelectionChanged>) {
          nlohmann::json params{{"selection", nullptr}};
          if (value.selection.has_value()) {
            const auto& selection = *value.selection;
            params["selection"] = SelectionResult{
                .file_path = selection.file_path,
                .text = selection.text,
                .selection = SelectionRange{.start = Position{.line = selection.start_line, .character = 0},
                                            .end = Position{.line = selection.end_line, .character = 0}},
            };
          }
          return JsonRpcNotification{.method = "notifications/selectionChanged", .params = std::move(params)};
        } else if constexpr (std::is_same_v<T, ActiveFileChanged>) {
          return JsonRpcNotification{.method = "notifications/activeFileChanged",
                                     .params = nlohmann::json{{"fileIndex", value.file_index}}};
        } else if constexpr (std::is_same_v<T, FilesChanged>) {
          return JsonRpcNotification{.method = "notifications/filesChanged", .params = std::nullopt};
        } else {
          return JsonRpcNotification{.method = "notifications/diagnosticsChanged", .params = std::nullopt};
        }
      },
      event);
}

}  // namespace revue::ide
