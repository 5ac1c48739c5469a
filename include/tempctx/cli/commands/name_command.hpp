#pragma once

#include <string>

#include "tempctx/cli/application.hpp"
#include "tempctx/common.hpp"

namespace tempctx::cli {

/**
 * Show how a name is turned into temporary entry names, without creating any
 */
class NameCommand : public Command {
public:
  NameCommand() = default;

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  std::string name_ = "name";
  std::string description_ = "Show the prefix and suffix a temporary entry for NAME would get";

  std::string input_;
};

}  // namespace tempctx::cli
