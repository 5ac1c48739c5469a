#include "tempctx/cli/commands/name_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tempctx/core/name_sanitizer.hpp"

namespace tempctx::cli {

void NameCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("name", input_, "File name or prefix template")->required();
}

Result<int> NameCommand::execute(const GlobalOptions& options) {
  auto prefix = core::sanitizePrefix(input_);
  auto parts = core::splitName(input_);
  std::string suffix = parts.suffix.value_or(std::string(core::kDefaultSuffix));

  if (options.json) {
    nlohmann::json output;
    output["name"] = input_;
    output["prefix"] = prefix;
    output["file_prefix"] = parts.prefix;
    output["file_suffix"] = suffix;
    output["extension_preserved"] = parts.suffix.has_value();
    std::cout << output.dump(2) << "\n";
  } else if (!options.quiet) {
    std::cout << "Directory prefix: " << prefix << "\n";
    std::cout << "File prefix:      " << parts.prefix << "\n";
    std::cout << "File suffix:      " << suffix
              << (parts.suffix.has_value() ? "" : " (default)") << "\n";
  }

  return 0;
}

}  // namespace tempctx::cli
