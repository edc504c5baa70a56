#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace revue::ide {

class DiscoveryError : public std::runtime_error {
 public:
  enum class Kind : std::uint8_t {
    NoHomeDirectory,
    IoFailure,
    SerializeFailure,
  };

  DiscoveryError(Kind kind, const std::string& message);

  [[nodiscard]] Kind kind() const noexcept { return kind_; }

 private:
  Kind kind_;
};

struct DiscoveryOptions {
  std::string tool_dir{".claude"};
  std::string ide_name{"revue"};
  std::optional<std::string> ide_version{};
};

// $HOME when set and non-empty, else the password database entry.
// Both arguments may be null; throws NoHomeDirectory when neither is usable.
std::filesystem::path resolve_home_directory(const char* env_home, const char* passwd_home);
std::filesystem::path home_directory();

std::filesystem::path discovery_directory(const DiscoveryOptions& options);

nlohmann::json discovery_content(std::uint16_t port, const std::string& workspace_path,
                                 const DiscoveryOptions& options);

// Owns `<home>/<tool_dir>/ide/<port>.lock` for as long as it lives.
class DiscoveryRecord {
 public:
  static DiscoveryRecord create(std::uint16_t port, const std::string& workspace_path,
                                const DiscoveryOptions& options = {});

  DiscoveryRecord(DiscoveryRecord&& other) noexcept;
  DiscoveryRecord& operator=(DiscoveryRecord&& other) noexcept;
  DiscoveryRecord(const DiscoveryRecord&) = delete;
  DiscoveryRecord& operator=(const DiscoveryRecord&) = delete;
  ~DiscoveryRecord();

  // Idempotent; throws IoFailure only when an existing file cannot be deleted.
  void remove();

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  explicit DiscoveryRecord(std::filesystem::path path);

  std::filesystem::path path_;
};

}  // namespace revue::ide
