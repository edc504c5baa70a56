#include "model/review.hpp"

#include <algorithm>
#include <utility>

namespace revue::model {

const char* file_status_name(const FileStatus status) {
    switch (status) {
        case FileStatus::Added:
            return "Added";
        case FileStatus::Modified:
            return "Modified";
        case FileStatus::Deleted:
            return "Deleted";
        case FileStatus::Renamed:
            return "Renamed";
        case FileStatus::Copied:
            return "Copied";
    }
    return "Modified";
}

const char* comment_type_name(const CommentType type) {
    switch (type) {
        case CommentType::Note:
            return "Note";
        case CommentType::Suggestion:
            return "Suggestion";
        case CommentType::Issue:
            return "Issue";
        case CommentType::Praise:
            return "Praise";
    }
    return "Note";
}

std::string DiffFile::display_path() const {
    if (new_path.has_value()) {
        return *new_path;
    }
    return old_path.value_or(std::string{});
}

ReviewSession::ReviewSession(std::string repo_path, std::vector<DiffFile> files)
    : repo_path_(std::move(repo_path)), files_(std::move(files)) {}

bool ReviewSession::is_file_reviewed(const std::string& path) const {
    const auto it = reviews_.find(path);
    return it != reviews_.end() && it->second.reviewed;
}

void ReviewSession::set_reviewed(const std::string& path, const bool reviewed) { reviews_[path].reviewed = reviewed; }

void ReviewSession::add_file_comment(const std::string& path, Comment comment) {
    reviews_[path].file_comments.push_back(std::move(comment));
}

void ReviewSession::add_line_comment(const std::string& path, const std::uint32_t line, Comment comment) {
    reviews_[path].line_comments[line].push_back(std::move(comment));
}

std::size_t ReviewSession::line_offset(const std::size_t file_index) const {
    std::size_t offset = 0;
    const auto limit = std::min(file_index, files_.size());
    for (std::size_t i = 0; i < limit; ++i) {
        offset += files_[i].lines.size();
    }
    return offset;
}

std::size_t ReviewSession::total_lines() const { return line_offset(files_.size()); }

}  // namespace revue::model
