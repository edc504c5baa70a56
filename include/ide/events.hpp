#pragma once

#include <cstddef>
#include <optional>
#include <variant>

#include "ide/protocol.hpp"
#include "ide/state.hpp"

namespace revue::ide {

// Server-to-client notifications. Nothing emits these yet; they travel
// through Server::broadcast_notification once the host starts pushing.
struct SelectionChanged {
  std::optional<Selection> selection;
};

struct ActiveFileChanged {
  std::size_t file_index{0};
};

struct FilesChanged {};

struct DiagnosticsChanged {};

using IdeEvent = std::variant<SelectionChanged, ActiveFileChanged, FilesChanged, DiagnosticsChanged>;

JsonRpcNotification to_notification(const IdeEvent& event);

}  // namespace revue::ide
