#include "tempctx/cli/commands/config_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tempctx/util/filesystem.hpp"

namespace tempctx::cli {

namespace {

const std::vector<std::string> kConfigKeys = {"base_dir", "logging.level", "logging.file"};

}  // namespace

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value (empty to unset)")->required();
  set_cmd->callback([this]() { set_mode_ = true; });

  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { list_mode_ = true; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { validate_mode_ = true; });

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  if (get_mode_) {
    return executeGet(options.json);
  } else if (set_mode_) {
    return executeSet(options.json);
  } else if (list_mode_) {
    return executeList(options.json);
  } else if (path_mode_) {
    return executePath(options.json);
  } else if (validate_mode_) {
    return executeValidate(options.json);
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet(bool json_output) {
  auto value = app_.config().get(key_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (json_output) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *value;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << *value << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(bool json_output) {
  auto& config = app_.config();
  auto result = config.set(key_, value_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  auto save_result = config.save(app_.configPath());
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }

  if (json_output) {
    nlohmann::json output;
    output["success"] = true;
    output["key"] = key_;
    output["value"] = value_;
    output["config_path"] = app_.configPath().string();
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "Configuration updated: " << key_ << " = " << value_ << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeList(bool json_output) {
  auto& config = app_.config();
  nlohmann::json output = nlohmann::json::object();

  for (const auto& key : kConfigKeys) {
    auto value = config.get(key);
    if (!value.has_value()) {
      return std::unexpected(value.error());
    }
    if (json_output) {
      output[key] = *value;
    } else {
      std::cout << key << " = " << *value << "\n";
    }
  }

  if (json_output) {
    std::cout << output.dump(2) << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executePath(bool json_output) {
  const auto& config_path = app_.configPath();
  bool exists = util::FileSystem::exists(config_path);

  if (json_output) {
    nlohmann::json output;
    output["config_path"] = config_path.string();
    output["exists"] = exists;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "Configuration file: " << config_path.string() << "\n";
    std::cout << (exists ? "Status: file exists\n" : "Status: file not found (using defaults)\n");
  }
  return 0;
}

Result<int> ConfigCommand::executeValidate(bool json_output) {
  auto result = app_.config().validate();

  if (json_output) {
    nlohmann::json output;
    output["valid"] = result.has_value();
    if (!result.has_value()) {
      output["error"] = result.error().describe();
    }
    std::cout << output.dump(2) << "\n";
  } else if (result.has_value()) {
    std::cout << "Configuration is valid\n";
  } else {
    std::cout << "Configuration validation failed: " << result.error().describe() << "\n";
  }
  return result.has_value() ? 0 : 1;
}

}  // namespace tempctx::cli
