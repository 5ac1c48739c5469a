#include "tempctx/cli/application.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tempctx/util/filesystem.hpp"
#include "tempctx/util/logging.hpp"

// Command includes
#include "tempctx/cli/commands/config_command.hpp"
#include "tempctx/cli/commands/exec_command.hpp"
#include "tempctx/cli/commands/name_command.hpp"

namespace tempctx::cli {

Application::Application()
    : app_("tempctx", "Run commands against self-cleaning temporary files")
    , services_initialized_(false) {

  app_.set_version_flag("--version", tempctx::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

Result<void> Application::initialize() {
  return initializeServices();
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose logging (repeat for more)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Only log errors");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--base-dir", global_options_.base_dir, "Directory for temporary entries");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<ExecCommand>(*this));
  registerCommand(std::make_unique<NameCommand>());
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  tempctx exec --file report.csv -- sort -o {0} data.csv
  tempctx exec --dir build_ -- make -C {0}
  tempctx name "archive.tar.gz" --json
  tempctx config set logging.level debug

For more information on a specific command, run:
  tempctx <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      printError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      printError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  // An explicit --config must exist; the default one is optional
  if (!global_options_.config_file.empty()) {
    config_path_ = global_options_.config_file;
    auto loaded = config_.load(config_path_);
    if (!loaded.has_value()) {
      return loaded;
    }
  } else {
    config_path_ = config::Config::defaultConfigPath();
    if (util::FileSystem::exists(config_path_)) {
      auto loaded = config_.load(config_path_);
      if (!loaded.has_value()) {
        return loaded;
      }
    }
  }

  util::LogSettings settings = config_.logging;
  if (global_options_.quiet) {
    settings.level = spdlog::level::err;
  } else if (global_options_.verbose >= 3) {
    settings.level = spdlog::level::trace;
  } else if (global_options_.verbose == 2) {
    settings.level = spdlog::level::debug;
  } else if (global_options_.verbose == 1) {
    settings.level = spdlog::level::info;
  }

  auto logging = util::Logging::configure(settings);
  if (!logging.has_value()) {
    return logging;
  }

  util::Logging::logger()->debug("Configuration loaded from {}", config_path_.string());

  services_initialized_ = true;
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  return config_;
}

const std::filesystem::path& Application::configPath() const {
  return config_path_;
}

std::optional<std::filesystem::path> Application::baseDirectory() const {
  if (!global_options_.base_dir.empty()) {
    return std::filesystem::path(global_options_.base_dir);
  }
  return config_.base_dir;
}

void Application::printError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    output["kind"] = std::string(errorCodeToString(error.code()));
    if (!error.path().empty()) {
      output["path"] = error.path().string();
    }
    if (!error.causes().empty()) {
      nlohmann::json causes = nlohmann::json::array();
      for (const auto& cause : error.causes()) {
        causes.push_back(cause.describe());
      }
      output["causes"] = causes;
    }
    std::cout << output.dump(2) << "\n";
  } else {
    std::cerr << "Error: " << error.describe() << "\n";
  }
}

} // namespace tempctx::cli
