#include "ide/tools.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace revue::ide {

namespace {

ToolCallResult open_file_failure(std::string message) {
  return ToolCallResult::error(to_text(OpenFileResult{.success = false, .error = std::move(message)}));
}

}  // namespace

ToolCallResult open_file(const nlohmann::json& arguments, CommandBridge& commands) {
  const auto path_it = arguments.find("filePath");
  if (path_it == arguments.end() || !path_it->is_string()) {
    return open_file_failure("Missing required parameter: filePath");
  }

  // A line that is not a usable integer opens the file without moving the cursor.
  std::optional<std::uint32_t> line;
  if (const auto line_it = arguments.find("line"); line_it != arguments.end() && line_it->is_number_integer()) {
    const auto value = line_it->get<std::int64_t>();
    if (value >= 0 && value <= std::numeric_limits<std::uint32_t>::max()) {
      line = static_cast<std::uint32_t>(value);
    }
  }

  const auto status = commands.try_send(OpenFileCommand{.path = path_it->get<std::string>(), .line = line});
  if (status != SendStatus::Queued) {
    return open_file_failure(std::string("Failed to send command: ") + send_status_name(status));
  }

  return ToolCallResult::text(to_text(OpenFileResult{.success = true, .error = std::nullopt}));
}

}  // namespace revue::ide
