#include "ide/state.hpp"

#include <filesystem>
#include <utility>

namespace revue::ide {

std::vector<WorkspaceFolderInfo> ReviewStateSnapshot::workspace_folders() const {
  if (!workspace_path.has_value()) {
    return {};
  }

  if (workspace_name.has_value()) {
    return {WorkspaceFolderInfo{.path = *workspace_path, .name = *workspace_name}};
  }

  // Trailing separators would leave an empty filename.
  auto path = std::filesystem::path(*workspace_path);
  if (!path.has_filename() && path.has_parent_path()) {
    path = path.parent_path();
  }
  std::string name = path.filename().string();
  if (name.empty()) {
    name = "workspace";
  }
  return {WorkspaceFolderInfo{.path = *workspace_path, .name = std::move(name)}};
}

std::vector<DiagnosticInfo> ReviewStateSnapshot::diagnostics_for(const std::optional<std::string>& file_path) const {
  if (!file_path.has_value()) {
    return diagnostics;
  }

  std::vector<DiagnosticInfo> matched;
  for (const auto& diagnostic : diagnostics) {
    if (diagnostic.file_path == *file_path) {
      matched.push_back(diagnostic);
    }
  }
  return matched;
}

void ReviewStateSnapshot::set_workspace(std::string path, std::optional<std::string> name) {
  workspace_path = std::move(path);
  workspace_name = std::move(name);
}

void ReviewStateSnapshot::set_active_file(const std::size_t index) {
  active_file_index = index;
  for (std::size_t i = 0; i < open_files.size(); ++i) {
    open_files[i].is_active = i == index;
  }
}

SharedStateStore::ReadGuard SharedStateStore::read() const { return ReadGuard(*this); }

SharedStateStore::WriteGuard SharedStateStore::write() {
  return WriteGuard(std::unique_lock<std::shared_mutex>(mutex_), snapshot_);
}

std::optional<SharedStateStore::WriteGuard> SharedStateStore::try_write() {
  std::unique_lock<std::shared_mutex> lock(mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    return std::nullopt;
  }
  return WriteGuard(std::move(lock), snapshot_);
}

bool SharedStateStore::try_publish(ReviewStateSnapshot snapshot) {
  auto guard = try_write();
  if (!guard.has_value()) {
    return false;
  }
  **guard = std::move(snapshot);
  return true;
}

}  // namespace revue::ide
