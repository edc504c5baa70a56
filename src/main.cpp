#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/host.hpp"
#include "model/review.hpp"

namespace {

constexpr const char* kDefaultConfigPath = "configs/revue.yaml";

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

revue::model::DiffFile load_diff_file(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open review file: " + path);
  }

  revue::model::DiffFile file{};
  file.new_path = path;
  file.old_path = path;
  file.status = revue::model::FileStatus::Modified;

  std::string line;
  std::uint32_t lineno = 0;
  while (std::getline(input, line)) {
    ++lineno;
    file.lines.push_back(revue::model::DiffLine{.old_lineno = lineno, .new_lineno = lineno, .content = line});
  }
  return file;
}

}  // namespace

std::string format_config_settings(const revue::core::HostConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[host] loaded config from " << config_path
         << " | frame_interval_ms=" << config.frame_interval.count()
         << " | status_line=" << (config.status_line ? "true" : "false")
         << " | ide_enabled=" << (config.ide.enabled ? "true" : "false")
         << " | ide_tool_dir=" << config.ide.tool_dir
         << " | ide_name=" << config.ide.name
         << " | command_queue_capacity=" << config.ide.command_queue_capacity
         << " | outbound_queue_capacity=" << config.ide.outbound_queue_capacity
         << " | commands_per_frame=" << config.ide.commands_per_frame
         << " | max_buffered_bytes=" << config.ide.max_buffered_bytes
         << " | max_message_bytes=" << config.ide.max_message_bytes;
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const bool explicit_config = argc > 1;
  const std::string config_path = explicit_config ? argv[1] : kDefaultConfigPath;

  revue::core::HostConfig config{};
  if (explicit_config || std::filesystem::exists(config_path)) {
    try {
      config = revue::core::load_host_config(config_path);
    } catch (const std::exception& ex) {
      std::cerr << "config error: " << ex.what() << '\n';
      return 1;
    }
    std::cerr << format_config_settings(config, config_path) << '\n';
  } else {
    std::cerr << "[host] " << config_path << " not found, using defaults\n";
  }

  std::vector<revue::model::DiffFile> files;
  for (int i = 2; i < argc; ++i) {
    try {
      files.push_back(load_diff_file(argv[i]));
    } catch (const std::exception& ex) {
      std::cerr << "[host] " << ex.what() << '\n';
      return 1;
    }
  }

  revue::core::ReviewHost host{config,
                               revue::model::ReviewSession(std::filesystem::current_path().string(), std::move(files))};

  if (const auto port = host.start_ide(); port.has_value()) {
    std::cout << "revue ide server listening on port " << *port << '\n';
  }

  while (g_shutdown_requested == 0) {
    host.run_for_frames(1);
  }

  std::cerr << "[host] shutdown signal received; exiting cleanly\n";
  host.shutdown();

  return 0;
}
