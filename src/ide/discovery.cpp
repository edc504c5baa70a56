#include "ide/discovery.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace revue::ide {

DiscoveryError::DiscoveryError(const Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::filesystem::path resolve_home_directory(const char* env_home, const char* passwd_home) {
  if (env_home != nullptr && *env_home != '\0') {
    return env_home;
  }
  if (passwd_home != nullptr && *passwd_home != '\0') {
    return passwd_home;
  }
  throw DiscoveryError(DiscoveryError::Kind::NoHomeDirectory, "could not determine home directory");
}

std::filesystem::path home_directory() {
  const passwd* entry = ::getpwuid(::getuid());
  return resolve_home_directory(std::getenv("HOME"), entry != nullptr ? entry->pw_dir : nullptr);
}

std::filesystem::path discovery_directory(const DiscoveryOptions& options) {
  return home_directory() / options.tool_dir / "ide";
}

nlohmann::json discovery_content(const std::uint16_t port, const std::string& workspace_path,
                                 const DiscoveryOptions& options) {
  nlohmann::json content{{"pid", static_cast<std::int64_t>(::getpid())},
                         {"workspacePath", workspace_path},
                         {"transport", "ws://127.0.0.1:" + std::to_string(port)},
                         {"ideName", options.ide_name}};
  if (options.ide_version.has_value()) {
    content["ideVersion"] = *options.ide_version;
  }
  return content;
}

DiscoveryRecord DiscoveryRecord::create(const std::uint16_t port, const std::string& workspace_path,
                                        const DiscoveryOptions& options) {
  const auto directory = discovery_directory(options);

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    throw DiscoveryError(DiscoveryError::Kind::IoFailure,
                         "failed to create discovery directory " + directory.string() + ": " + ec.message());
  }

  std::string serialized;
  try {
    serialized = discovery_content(port, workspace_path, options).dump(2);
  } catch (const nlohmann::json::exception& ex) {
    throw DiscoveryError(DiscoveryError::Kind::SerializeFailure, ex.what());
  }

  auto path = directory / (std::to_string(port) + ".lock");
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw DiscoveryError(DiscoveryError::Kind::IoFailure, "failed to open " + path.string());
  }
  out << serialized << '\n';
  out.close();
  if (!out) {
    throw DiscoveryError(DiscoveryError::Kind::IoFailure, "failed to write " + path.string());
  }

  std::cerr << "[discovery] wrote " << path.string() << '\n';
  return DiscoveryRecord(std::move(path));
}

DiscoveryRecord::DiscoveryRecord(std::filesystem::path path) : path_(std::move(path)) {}

DiscoveryRecord::DiscoveryRecord(DiscoveryRecord&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

DiscoveryRecord& DiscoveryRecord::operator=(DiscoveryRecord&& other) noexcept {
  if (this != &other) {
    std::error_code ec;
    if (!path_.empty()) {
      std::filesystem::remove(path_, ec);
    }
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

DiscoveryRecord::~DiscoveryRecord() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    std::cerr << "[discovery] failed to remove " << path_.string() << ": " << ec.message() << '\n';
  }
}

void DiscoveryRecord::remove() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    throw DiscoveryError(DiscoveryError::Kind::IoFailure,
                         "failed to remove " + path_.string() + ": " + ec.message());
  }
}

}  // namespace revue::ide
