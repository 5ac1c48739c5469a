#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "tempctx/common.hpp"
#include "tempctx/config/config.hpp"

namespace tempctx::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Only log errors
  std::string config_file;     // --config: Path to config file
  std::string base_dir;        // --base-dir: Override directory for temporary entries
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  /**
   * @brief Get the command name
   */
  virtual std::string name() const = 0;

  /**
   * @brief Get the command description
   */
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @param argc Argument count
   * @param argv Argument vector
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Load configuration and set up logging without running a command
   */
  Result<void> initialize();

  const GlobalOptions& globalOptions() const;
  config::Config& config();

  // Config file in use: --config, else the default location
  const std::filesystem::path& configPath() const;

  // --base-dir, else the configured base_dir, else the system default (nullopt)
  std::optional<std::filesystem::path> baseDirectory() const;

  // Report an error in the selected output format
  void printError(const Error& error) const;

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  // Initialization
  Result<void> initializeServices();

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  config::Config config_;
  std::filesystem::path config_path_;
  bool services_initialized_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace tempctx::cli
