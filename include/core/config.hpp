#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace revue::core {

struct IdeConfig {
  bool enabled{true};
  std::string tool_dir{".claude"};
  std::string name{"revue"};
  std::size_t command_queue_capacity{32};
  std::size_t outbound_queue_capacity{32};
  std::size_t commands_per_frame{10};
  std::size_t max_buffered_bytes{1024U * 1024U};
  std::size_t max_message_bytes{16U * 1024U * 1024U};
};

struct HostConfig {
  std::chrono::milliseconds frame_interval{1000 / 30};
  bool status_line{true};
  IdeConfig ide{};
};

HostConfig load_host_config(const std::string& path);

}  // namespace revue::core
