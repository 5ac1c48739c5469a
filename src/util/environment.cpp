#include "tempctx/util/environment.hpp"

#include <cstdlib>

namespace tempctx::util {

std::filesystem::path Environment::tempDirectory() {
  std::string tmpdir = getEnvVar("TMPDIR", "");
  if (!tmpdir.empty()) {
    return std::filesystem::path(tmpdir);
  }

  return std::filesystem::path("/tmp");
}

std::filesystem::path Environment::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "tempctx";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".tempctx_config";
  }

  return std::filesystem::path(home) / ".config" / "tempctx";
}

std::filesystem::path Environment::configFile() {
  return configHome() / "config.toml";
}

std::string Environment::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace tempctx::util
