#include "sinks/status_line.hpp"

#include <cstdio>
#include <sstream>
#include <utility>

namespace revue::sinks {

std::string format_status(const StatusView& view) {
  std::ostringstream out;
  out << "[status] file=" << (view.file_count == 0 ? 0 : view.file_index + 1) << '/' << view.file_count;
  if (!view.file_path.empty()) {
    out << " path=" << view.file_path;
  }
  out << " line=" << view.cursor_line << " reviewed=" << view.reviewed_files << '/' << view.file_count
      << " comments=" << view.comments << " ide=";
  if (view.ide_port.has_value()) {
    out << "ws://127.0.0.1:" << *view.ide_port << " clients=" << view.ide_clients;
  } else {
    out << "off";
  }
  return out.str();
}

bool StatusLineSink::publish(const StatusView& view) {
  auto rendered = format_status(view);
  if (rendered == last_rendered_) {
    return false;
  }
  std::printf("%s\n", rendered.c_str());
  std::fflush(stdout);
  last_rendered_ = std::move(rendered);
  return true;
}

}  // namespace revue::sinks
