#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace revue::sinks {

struct StatusView {
  std::size_t file_index{0};
  std::size_t file_count{0};
  std::string file_path{};
  std::size_t cursor_line{0};
  std::size_t reviewed_files{0};
  std::size_t comments{0};
  std::optional<std::uint16_t> ide_port{};
  std::size_t ide_clients{0};
};

std::string format_status(const StatusView& view);

// Prints one status line to stdout whenever the view changes.
class StatusLineSink {
 public:
  bool publish(const StatusView& view);

 private:
  std::string last_rendered_{};
};

}  // namespace revue::sinks
