#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tempctx/common.hpp"
#include "tempctx/util/logging.hpp"

namespace tempctx::config {

// Configuration for the tempctx command line tool
class Config {
 public:
  // Built-in defaults, nothing loaded
  Config() = default;

  // Directory temp entries are created in; the system temp directory when unset
  std::optional<std::filesystem::path> base_dir;

  // [logging] table
  util::LogSettings logging;

  // Load configuration from file, overriding only the keys it sets
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file (the loaded file, else the default path)
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values using dot notation ("logging.level")
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // Validate configuration
  Result<void> validate() const;

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

 private:
  std::filesystem::path config_path_;

  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace tempctx::config
