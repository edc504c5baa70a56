#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace revue::model {

enum class FileStatus : std::uint8_t {
    Added,
    Modified,
    Deleted,
    Renamed,
    Copied,
};

const char* file_status_name(FileStatus status);

struct DiffLine {
    std::optional<std::uint32_t> old_lineno;
    std::optional<std::uint32_t> new_lineno;
    std::string content;
};

struct DiffFile {
    std::optional<std::string> new_path;
    std::optional<std::string> old_path;
    FileStatus status{FileStatus::Modified};
    std::vector<DiffLine> lines;

    // New path, else old path, else empty.
    [[nodiscard]] std::string display_path() const;
};

enum class CommentType : std::uint8_t {
    Note,
    Suggestion,
    Issue,
    Praise,
};

const char* comment_type_name(CommentType type);

struct LineRange {
    std::uint32_t start{0};
    std::uint32_t end{0};
};

struct Comment {
    std::string id;
    std::string content;
    CommentType type{CommentType::Note};
    std::optional<LineRange> range;
};

struct FileReview {
    bool reviewed{false};
    std::vector<Comment> file_comments;
    std::map<std::uint32_t, std::vector<Comment>> line_comments;
};

// Viewer position. `cursor_line` and `scroll_offset` index the flattened
// list of every file's diff lines in file order.
struct CursorState {
    std::size_t current_file{0};
    std::size_t cursor_line{0};
    std::size_t scroll_offset{0};
    std::size_t viewport_height{20};
    std::optional<std::uint32_t> visual_anchor;
};

class ReviewSession {
 public:
    explicit ReviewSession(std::string repo_path, std::vector<DiffFile> files = {});

    [[nodiscard]] const std::string& repo_path() const noexcept { return repo_path_; }
    [[nodiscard]] const std::vector<DiffFile>& files() const noexcept { return files_; }
    [[nodiscard]] const std::map<std::string, FileReview>& reviews() const noexcept { return reviews_; }

    [[nodiscard]] bool is_file_reviewed(const std::string& path) const;
    void set_reviewed(const std::string& path, bool reviewed);
    void add_file_comment(const std::string& path, Comment comment);
    void add_line_comment(const std::string& path, std::uint32_t line, Comment comment);

    // Index of the first line of `file_index` in the flattened line list.
    [[nodiscard]] std::size_t line_offset(std::size_t file_index) const;
    [[nodiscard]] std::size_t total_lines() const;

    CursorState& cursor() noexcept { return cursor_; }
    [[nodiscard]] const CursorState& cursor() const noexcept { return cursor_; }

 private:
    std::string repo_path_;
    std::vector<DiffFile> files_;
    std::map<std::string, FileReview> reviews_;
    CursorState cursor_{};
};

}  // namespace revue::model
