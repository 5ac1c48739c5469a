#pragma once

#include <filesystem>
#include <string>

namespace tempctx::util {

// Environment-derived locations used by the library and the CLI
class Environment {
 public:
  // System temporary directory ($TMPDIR, falling back to /tmp)
  static std::filesystem::path tempDirectory();

  // Get XDG config home directory (~/.config/tempctx)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace tempctx::util
