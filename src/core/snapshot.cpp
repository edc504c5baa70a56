#include "core/snapshot.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace revue::core {
namespace {

const std::unordered_map<std::string, std::string>& language_table() {
  static const std::unordered_map<std::string, std::string> table{
      {"rs", "rust"},          {"py", "python"},           {"js", "javascript"}, {"ts", "typescript"},
      {"tsx", "typescriptreact"}, {"jsx", "javascriptreact"}, {"go", "go"},       {"java", "java"},
      {"c", "c"},              {"h", "c"},                 {"cpp", "cpp"},       {"hpp", "cpp"},
      {"cc", "cpp"},           {"cxx", "cpp"},             {"rb", "ruby"},       {"php", "php"},
      {"swift", "swift"},      {"kt", "kotlin"},           {"kts", "kotlin"},    {"scala", "scala"},
      {"lua", "lua"},          {"sh", "shellscript"},      {"bash", "shellscript"}, {"json", "json"},
      {"yaml", "yaml"},        {"yml", "yaml"},            {"toml", "toml"},     {"xml", "xml"},
      {"html", "html"},        {"css", "css"},             {"scss", "scss"},     {"md", "markdown"},
  };
  return table;
}

std::optional<ide::Selection> visual_selection(const model::ReviewSession& session) {
  const auto& cursor = session.cursor();
  if (!cursor.visual_anchor.has_value() || cursor.current_file >= session.files().size()) {
    return std::nullopt;
  }

  const auto& file = session.files()[cursor.current_file];
  const std::uint32_t anchor = *cursor.visual_anchor;

  std::string text;
  for (const auto& line : file.lines) {
    if (line.new_lineno == anchor || line.old_lineno == anchor) {
      text = line.content;
      break;
    }
  }

  return ide::Selection{.file_path = file.display_path(), .text = std::move(text), .start_line = anchor, .end_line = anchor};
}

}  // namespace

std::string language_for_path(const std::string& path) {
  std::string extension = std::filesystem::path(path).extension().string();
  if (!extension.empty() && extension.front() == '.') {
    extension.erase(0, 1);
  }
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  const auto& table = language_table();
  const auto it = table.find(extension);
  return it != table.end() ? it->second : "plaintext";
}

const char* severity_for_comment(const model::CommentType type) {
  switch (type) {
    case model::CommentType::Issue:
      return "error";
    case model::CommentType::Suggestion:
      return "warning";
    case model::CommentType::Note:
      return "information";
    case model::CommentType::Praise:
      return "hint";
  }
  return "information";
}

ide::ReviewStateSnapshot build_snapshot(const model::ReviewSession& session) {
  ide::ReviewStateSnapshot snapshot{};
  snapshot.set_workspace(session.repo_path(), std::nullopt);

  const auto& files = session.files();
  snapshot.open_files.reserve(files.size());
  for (const auto& file : files) {
    const auto path = file.display_path();
    const bool reviewed = session.is_file_reviewed(path);
    snapshot.open_files.push_back(ide::OpenFileInfo{
        .file_path = path,
        .language_id = language_for_path(path),
        .is_dirty = !reviewed,
        .is_active = false,
        .status = model::file_status_name(file.status),
        .reviewed = reviewed,
    });
  }
  snapshot.set_active_file(session.cursor().current_file);

  for (const auto& [path, review] : session.reviews()) {
    for (const auto& comment : review.file_comments) {
      snapshot.diagnostics.push_back(ide::DiagnosticInfo{
          .file_path = path,
          .start_line = 1,
          .end_line = 1,
          .message = comment.content,
          .severity = severity_for_comment(comment.type),
          .comment_type = model::comment_type_name(comment.type),
      });
    }

    for (const auto& [line, comments] : review.line_comments) {
      for (const auto& comment : comments) {
        const auto range = comment.range.value_or(model::LineRange{.start = line, .end = line});
        snapshot.diagnostics.push_back(ide::DiagnosticInfo{
            .file_path = path,
            .start_line = range.start,
            .end_line = range.end,
            .message = comment.content,
            .severity = severity_for_comment(comment.type),
            .comment_type = model::comment_type_name(comment.type),
        });
      }
    }
  }

  snapshot.selection = visual_selection(session);
  return snapshot;
}

}  // namespace revue::core
