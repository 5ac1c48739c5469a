#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "tempctx/common.hpp"

namespace tempctx::util {

struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::warn;
  std::filesystem::path file;  // empty: console only
};

// Owner of the "tempctx" logger shared by the library and the CLI
class Logging {
 public:
  // Logger with a stderr sink, created on first use
  static std::shared_ptr<spdlog::logger> logger();

  // Apply level and optional rotating file sink. Meant for process startup.
  static Result<void> configure(const LogSettings& settings);

  // "trace", "debug", "info", "warn", "error", "critical" or "off"
  static Result<spdlog::level::level_enum> parseLevel(std::string_view name);

  static std::string_view levelName(spdlog::level::level_enum level);
};

}  // namespace tempctx::util
