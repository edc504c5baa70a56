#include "core/host.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <variant>

#include "core/snapshot.hpp"
#include "ide/dispatcher.hpp"
#include "ide/tools.hpp"

namespace revue::core {

ReviewHost::ReviewHost(HostConfig config, model::ReviewSession session)
    : config_(std::move(config)), session_(std::move(session)), commands_(config_.ide.command_queue_capacity) {}

ReviewHost::~ReviewHost() { shutdown(); }

std::optional<std::uint16_t> ReviewHost::start_ide() {
  if (!config_.ide.enabled) {
    std::cerr << "[host] ide integration disabled by config\n";
    return std::nullopt;
  }
  if (server_ != nullptr) {
    return server_->port();
  }

  ide::ServerOptions options{};
  options.outbound_queue_capacity = config_.ide.outbound_queue_capacity;
  options.max_buffered_bytes = config_.ide.max_buffered_bytes;
  options.max_message_bytes = config_.ide.max_message_bytes;
  options.discovery.tool_dir = config_.ide.tool_dir;
  options.discovery.ide_name = config_.ide.name;
  options.discovery.ide_version = ide::kServerVersion;

  auto server = std::make_unique<ide::Server>(
      ide::MethodDispatcher(ide::build_tool_registry(state_, commands_), config_.ide.name), std::move(options));
  try {
    const auto port = server->start(session_.repo_path());
    server_ = std::move(server);
    return port;
  } catch (const ide::ServerError& ex) {
    std::cerr << "[host] ide server unavailable, continuing without it: " << ex.what() << '\n';
    return std::nullopt;
  }
}

HostStats ReviewHost::run_for_frames(const std::size_t total_frames) {
  HostStats stats{};

  if (first_frame_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_frame_ = false;
  }

  for (std::size_t i = 0; total_frames == 0 || i < total_frames; ++i) {
    if (total_frames == 0 && shutdown_requested_) {
      break;
    }

    render_status();
    apply_commands(stats);
    sync_state(stats);

    ++stats.frames_executed;

    next_wakeup_ += config_.frame_interval;
    std::this_thread::sleep_until(next_wakeup_);
  }

  return stats;
}

void ReviewHost::shutdown() {
  commands_.close();
  if (server_ != nullptr) {
    server_->stop();
    server_.reset();
  }
}

bool ReviewHost::open_file(const ide::OpenFileCommand& command) {
  const auto& files = session_.files();
  std::size_t file_index = files.size();
  for (std::size_t i = 0; i < files.size(); ++i) {
    if (files[i].display_path().find(command.path) != std::string::npos) {
      file_index = i;
      break;
    }
  }

  if (file_index == files.size()) {
    std::cerr << "[host] openFile: no file matching " << command.path << '\n';
    return false;
  }

  auto& cursor = session_.cursor();
  cursor.current_file = file_index;

  if (command.line.has_value()) {
    const auto& lines = files[file_index].lines;
    const auto offset = session_.line_offset(file_index);
    for (std::size_t j = 0; j < lines.size(); ++j) {
      if (lines[j].new_lineno != command.line && lines[j].old_lineno != command.line) {
        continue;
      }

      const std::size_t target = offset + j;
      cursor.cursor_line = target;
      const std::size_t visible = cursor.viewport_height > 0 ? cursor.viewport_height - 1 : 0;
      if (target < cursor.scroll_offset) {
        cursor.scroll_offset = target;
      } else if (target >= cursor.scroll_offset + visible) {
        cursor.scroll_offset = target - std::min(target, cursor.viewport_height / 2);
      }
      break;
    }
  }

  state_dirty_ = true;
  return true;
}

model::ReviewSession& ReviewHost::edit_session() {
  state_dirty_ = true;
  return session_;
}

void ReviewHost::render_status() {
  if (!config_.status_line) {
    return;
  }

  const auto& files = session_.files();
  const auto& cursor = session_.cursor();

  sinks::StatusView view{};
  view.file_index = cursor.current_file;
  view.file_count = files.size();
  if (cursor.current_file < files.size()) {
    view.file_path = files[cursor.current_file].display_path();
  }
  view.cursor_line = cursor.cursor_line;
  for (const auto& file : files) {
    if (session_.is_file_reviewed(file.display_path())) {
      ++view.reviewed_files;
    }
  }
  for (const auto& [path, review] : session_.reviews()) {
    view.comments += review.file_comments.size();
    for (const auto& [line, comments] : review.line_comments) {
      view.comments += comments.size();
    }
  }
  if (server_ != nullptr) {
    view.ide_port = server_->port();
    view.ide_clients = server_->client_count();
  }

  status_sink_.publish(view);
}

void ReviewHost::apply_commands(HostStats& stats) {
  for (const auto& command : commands_.drain(config_.ide.commands_per_frame)) {
    const bool applied = std::visit([this](const ide::OpenFileCommand& open) { return open_file(open); }, command);
    if (applied) {
      ++stats.commands_applied;
    } else {
      ++stats.commands_unmatched;
    }
  }
}

void ReviewHost::sync_state(HostStats& stats) {
  if (!state_dirty_) {
    return;
  }

  if (state_.try_publish(build_snapshot(session_))) {
    state_dirty_ = false;
    ++stats.syncs_published;
  } else {
    ++stats.syncs_skipped;
  }
}

}  // namespace revue::core
