#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "tempctx/cli/application.hpp"
#include "tempctx/common.hpp"

namespace tempctx::cli {

/**
 * Run a command against freshly created temporary entries
 *
 * Every --file and --dir becomes one entry of a single temp context, files
 * first, each group in the order given. Placeholders {0}, {1}, ... in the
 * command arguments are replaced with the entry paths. The context is closed
 * once the command exits, whatever its outcome.
 */
class ExecCommand : public Command {
public:
  explicit ExecCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

  // Replace every {N} in arg with paths[N]. Out of range indices and other
  // braces are left untouched.
  static std::string substitutePlaceholders(const std::string& arg,
                                            const std::vector<std::filesystem::path>& paths);

private:
  Application& app_;
  std::string name_ = "exec";
  std::string description_ = "Run a command with temporary files that are removed afterwards";

  std::vector<std::string> files_;
  std::vector<std::string> dirs_;
  std::vector<std::string> command_;
};

}  // namespace tempctx::cli
