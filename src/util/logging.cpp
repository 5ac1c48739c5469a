#include "tempctx/util/logging.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "tempctx/util/filesystem.hpp"

namespace tempctx::util {

namespace {

constexpr const char* kLoggerName = "tempctx";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
constexpr size_t kMaxLogFileSize = 1024 * 1024 * 5;  // 5MB files
constexpr size_t kMaxLogFiles = 3;

std::mutex& loggerMutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace

std::shared_ptr<spdlog::logger> Logging::logger() {
  std::lock_guard<std::mutex> lock(loggerMutex());
  static std::shared_ptr<spdlog::logger> logger_;

  if (!logger_) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
    logger_->set_pattern(kPattern);
    logger_->set_level(spdlog::level::warn);
  }

  return logger_;
}

Result<void> Logging::configure(const LogSettings& settings) {
  auto log = logger();
  log->set_level(settings.level);

  if (settings.file.empty()) {
    return {};
  }

  auto parent = settings.file.parent_path();
  if (!parent.empty() && !FileSystem::exists(parent)) {
    auto created = FileSystem::createDirectories(parent);
    if (!created.has_value()) {
      return created;
    }
  }

  try {
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      settings.file.string(), kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_pattern(kPattern);

    std::lock_guard<std::mutex> lock(loggerMutex());
    log->sinks().push_back(file_sink);
  } catch (const spdlog::spdlog_ex& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Failed to setup file logging: " + std::string(e.what()),
                                     settings.file));
  }

  return {};
}

Result<spdlog::level::level_enum> Logging::parseLevel(std::string_view name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown log level: " + std::string(name)));
}

std::string_view Logging::levelName(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace: return "trace";
    case spdlog::level::debug: return "debug";
    case spdlog::level::info: return "info";
    case spdlog::level::warn: return "warn";
    case spdlog::level::err: return "error";
    case spdlog::level::critical: return "critical";
    case spdlog::level::off: return "off";
    default: return "warn";
  }
}

}  // namespace tempctx::util
