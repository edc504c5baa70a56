#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace revue::ide {

struct Selection {
  std::string file_path;
  std::string text;
  std::uint32_t start_line{0};
  std::uint32_t end_line{0};
};

struct OpenFileInfo {
  std::string file_path;
  std::string language_id;
  bool is_dirty{false};
  bool is_active{false};
  std::string status;
  bool reviewed{false};
};

struct WorkspaceFolderInfo {
  std::string path;
  std::string name;
};

struct DiagnosticInfo {
  std::string file_path;
  std::uint32_t start_line{0};
  std::uint32_t end_line{0};
  std::string message;
  std::string severity;
  std::string comment_type;
};

// Review-session state as seen by tool handlers. The host replaces it
// wholesale on every sync.
struct ReviewStateSnapshot {
  std::optional<Selection> selection{};
  std::vector<OpenFileInfo> open_files{};
  std::optional<std::string> workspace_path{};
  std::optional<std::string> workspace_name{};
  std::vector<DiagnosticInfo> diagnostics{};
  std::size_t active_file_index{0};

  [[nodiscard]] std::vector<WorkspaceFolderInfo> workspace_folders() const;
  [[nodiscard]] std::vector<DiagnosticInfo> diagnostics_for(const std::optional<std::string>& file_path) const;

  void set_workspace(std::string path, std::optional<std::string> name);
  void set_active_file(std::size_t index);
};

class SharedStateStore {
 public:
  class ReadGuard {
   public:
    explicit ReadGuard(const SharedStateStore& store) : lock_(store.mutex_), snapshot_(store.snapshot_) {}

    const ReviewStateSnapshot& operator*() const noexcept { return snapshot_; }
    const ReviewStateSnapshot* operator->() const noexcept { return &snapshot_; }

   private:
    std::shared_lock<std::shared_mutex> lock_;
    const ReviewStateSnapshot& snapshot_;
  };

  class WriteGuard {
   public:
    WriteGuard(std::unique_lock<std::shared_mutex> lock, ReviewStateSnapshot& snapshot)
        : lock_(std::move(lock)), snapshot_(&snapshot) {}

    ReviewStateSnapshot& operator*() const noexcept { return *snapshot_; }
    ReviewStateSnapshot* operator->() const noexcept { return snapshot_; }

   private:
    std::unique_lock<std::shared_mutex> lock_;
    ReviewStateSnapshot* snapshot_;
  };

  SharedStateStore() = default;
  SharedStateStore(const SharedStateStore&) = delete;
  SharedStateStore& operator=(const SharedStateStore&) = delete;

  [[nodiscard]] ReadGuard read() const;
  [[nodiscard]] WriteGuard write();
  // Never blocks: empty when a reader or writer currently holds the store.
  [[nodiscard]] std::optional<WriteGuard> try_write();

  // Replaces the snapshot if the store is free; false means the sync was skipped.
  bool try_publish(ReviewStateSnapshot snapshot);

 private:
  mutable std::shared_mutex mutex_;
  ReviewStateSnapshot snapshot_{};
};

}  // namespace revue::ide
