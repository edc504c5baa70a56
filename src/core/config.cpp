#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace revue::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (const char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::size_t parse_at_least(const std::string& key, const std::string& value, const long long minimum) {
  std::size_t consumed = 0;
  const auto parsed = std::stoll(value, &consumed);
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (parsed < minimum) {
    throw std::runtime_error(key + " must be greater than or equal to " + std::to_string(minimum));
  }
  return static_cast<std::size_t>(parsed);
}

std::string require_non_empty(const std::string& key, const std::string& value) {
  auto unquoted = unquote(value);
  if (unquoted.empty()) {
    throw std::runtime_error(key + " must not be empty");
  }
  return unquoted;
}

void apply_key_value(HostConfig& config, const std::string& key, const std::string& value) {
  if (key == "frame_rate_hz") {
    const auto hz = std::stoi(value);
    if (hz <= 0) {
      throw std::runtime_error("frame_rate_hz must be greater than 0");
    }

    if (hz > 240) {
      throw std::runtime_error("frame_rate_hz must be less than or equal to 240");
    }

    config.frame_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key == "host.status_line") {
    config.status_line = parse_bool(value);
    return;
  }

  if (key == "ide.enabled") {
    config.ide.enabled = parse_bool(value);
    return;
  }

  if (key == "ide.tool_dir") {
    config.ide.tool_dir = require_non_empty(key, value);
    return;
  }

  if (key == "ide.name") {
    config.ide.name = require_non_empty(key, value);
    return;
  }

  if (key == "ide.command_queue_capacity") {
    config.ide.command_queue_capacity = parse_at_least(key, value, 1);
    return;
  }

  if (key == "ide.outbound_queue_capacity") {
    config.ide.outbound_queue_capacity = parse_at_least(key, value, 1);
    return;
  }

  if (key == "ide.commands_per_frame") {
    config.ide.commands_per_frame = parse_at_least(key, value, 1);
    return;
  }

  if (key == "ide.max_buffered_bytes") {
    config.ide.max_buffered_bytes = parse_at_least(key, value, 1024);
    return;
  }

  if (key == "ide.max_message_bytes") {
    config.ide.max_message_bytes = parse_at_least(key, value, 1024);
    return;
  }
}

}  // namespace

HostConfig load_host_config(const std::string& path) {
  HostConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (depth > sections.size()) {
      throw std::runtime_error("unexpected indentation for key: " + key);
    }
    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    try {
      apply_key_value(config, full_key.str(), value);
    } catch (const std::logic_error&) {
      throw std::runtime_error("invalid value for " + full_key.str() + ": " + value);
    }
  }

  return config;
}

}  // namespace revue::core
