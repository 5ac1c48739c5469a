#include "tempctx/config/config.hpp"

#include <sstream>

#include <toml++/toml.hpp>

#include "tempctx/util/environment.hpp"
#include "tempctx/util/filesystem.hpp"

namespace tempctx::config {

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!util::FileSystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string(),
                                     config_path));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["base_dir"].value<std::string>()) {
      if (value->empty()) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "base_dir must not be empty",
                                         config_path));
      }
      base_dir = std::filesystem::path(*value);
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        auto level = util::Logging::parseLevel(*value);
        if (!level.has_value()) {
          return std::unexpected(level.error());
        }
        logging.level = *level;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        logging.file = *value;
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what()),
                                     config_path));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table config_data;
  if (base_dir.has_value()) {
    config_data.insert_or_assign("base_dir", base_dir->string());
  }

  auto logging_table = toml::table{};
  logging_table.insert_or_assign("level", std::string(util::Logging::levelName(logging.level)));
  if (!logging.file.empty()) {
    logging_table.insert_or_assign("file", logging.file.string());
  }
  config_data.insert_or_assign("logging", logging_table);

  std::stringstream ss;
  ss << config_data;
  auto write_result = util::FileSystem::writeFileAtomic(save_path, ss.str());
  if (!write_result.has_value()) {
    Error error(ErrorCode::kConfigError, "Cannot write config file: " + save_path.string(), save_path);
    error.addCause(write_result.error());
    return std::unexpected(std::move(error));
  }

  return {};
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1 && path[0] == "base_dir") {
    return base_dir.has_value() ? base_dir->string() : std::string();
  }
  if (path.size() == 2 && path[0] == "logging") {
    if (path[1] == "level") return std::string(util::Logging::levelName(logging.level));
    if (path[1] == "file") return logging.file.string();
  }

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1 && path[0] == "base_dir") {
    if (value.empty()) {
      base_dir.reset();
    } else {
      base_dir = std::filesystem::path(value);
    }
    return {};
  }
  if (path.size() == 2 && path[0] == "logging") {
    if (path[1] == "level") {
      auto level = util::Logging::parseLevel(value);
      if (!level.has_value()) {
        return std::unexpected(level.error());
      }
      logging.level = *level;
      return {};
    }
    if (path[1] == "file") {
      logging.file = value;
      return {};
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::validate() const {
  if (base_dir.has_value()) {
    auto valid = util::FileSystem::validateDirectory(*base_dir);
    if (!valid.has_value()) {
      Error error(ErrorCode::kConfigError, "Invalid base_dir: " + base_dir->string(), *base_dir);
      error.addCause(valid.error());
      return std::unexpected(std::move(error));
    }
  }

  if (!logging.file.empty()) {
    std::error_code ec;
    if (std::filesystem::is_directory(logging.file, ec)) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Log file is a directory: " + logging.file.string(),
                                       logging.file));
    }
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Environment::configFile();
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace tempctx::config
