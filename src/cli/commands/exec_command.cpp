#include "tempctx/cli/commands/exec_command.hpp"

#include <cctype>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

#include "tempctx/core/temp_context.hpp"
#include "tempctx/util/logging.hpp"
#include "tempctx/util/safe_process.hpp"
#include "tempctx/util/signal_guard.hpp"

namespace tempctx::cli {

ExecCommand::ExecCommand(Application& app) : app_(app) {}

void ExecCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("-f,--file", files_,
                  "Temporary file named after NAME, keeping its extension")
    ->type_name("NAME");
  cmd->add_option("-d,--dir", dirs_, "Temporary directory with the given prefix")
    ->type_name("PREFIX");
  cmd->add_option("command", command_, "Command and arguments, after --")
    ->required();

  cmd->footer(R"(Examples:
  tempctx exec --file out.json -- curl -o {0} https://example.com
  tempctx exec --file a.txt --dir work_ -- sh -c 'cp {0} {1}/')");
}

std::string ExecCommand::substitutePlaceholders(const std::string& arg,
                                                const std::vector<std::filesystem::path>& paths) {
  std::string result;
  result.reserve(arg.size());

  size_t pos = 0;
  while (pos < arg.size()) {
    if (arg[pos] == '{') {
      size_t end = pos + 1;
      while (end < arg.size() && std::isdigit(static_cast<unsigned char>(arg[end]))) {
        ++end;
      }
      if (end > pos + 1 && end < arg.size() && arg[end] == '}' && end - pos - 1 <= 9) {
        size_t index = std::stoul(arg.substr(pos + 1, end - pos - 1));
        if (index < paths.size()) {
          result += paths[index].string();
          pos = end + 1;
          continue;
        }
      }
    }
    result += arg[pos];
    ++pos;
  }

  return result;
}

Result<int> ExecCommand::execute(const GlobalOptions& options) {
  auto logger = util::Logging::logger();

  if (options.base_dir.empty()) {
    auto valid = app_.config().validate();
    if (!valid.has_value()) {
      return std::unexpected(valid.error());
    }
  }

  // Interrupts and termination requests end the child, not us, so the
  // context below is always closed
  util::SignalGuard signals;

  auto context = core::TempContext::create(app_.baseDirectory());
  if (!context.has_value()) {
    return std::unexpected(context.error());
  }
  auto& ctx = **context;

  // Entries stay open until the context is closed below
  std::vector<std::unique_ptr<core::TempEntry>> entries;
  std::vector<std::filesystem::path> paths;

  auto adopt = [&](Result<std::unique_ptr<core::TempEntry>> entry) -> Result<void> {
    if (!entry.has_value()) {
      return std::unexpected(entry.error());
    }
    auto path = (*entry)->path();
    if (!path.has_value()) {
      return std::unexpected(path.error());
    }
    paths.push_back(*path);
    entries.push_back(std::move(*entry));
    return {};
  };

  Result<void> prepared;
  for (const auto& file : files_) {
    prepared = adopt(ctx.createTempFile(std::string_view(file)));
    if (!prepared.has_value()) break;
  }
  if (prepared.has_value()) {
    for (const auto& dir : dirs_) {
      prepared = adopt(ctx.createTempDirectory(std::string_view(dir)));
      if (!prepared.has_value()) break;
    }
  }

  Result<int> exit_code = 0;
  int interrupted = util::SignalGuard::received();
  if (prepared.has_value() && interrupted != 0) {
    logger->warn("Signal {} received, not running {}", interrupted, command_[0]);
    exit_code = 128 + interrupted;
  } else if (prepared.has_value()) {
    std::vector<std::string> args;
    for (size_t i = 1; i < command_.size(); ++i) {
      args.push_back(substitutePlaceholders(command_[i], paths));
    }
    logger->info("Running {} in temp context {} with {} entries", command_[0], ctx.id(), paths.size());
    exit_code = util::SafeProcess::run(command_[0], args);
  } else {
    exit_code = std::unexpected(prepared.error());
  }

  auto closed = ctx.close();

  if (!exit_code.has_value()) {
    Error error = exit_code.error();
    if (!closed.has_value()) {
      error.addCause(closed.error());
    }
    return std::unexpected(std::move(error));
  }

  int code = *exit_code;
  if (!closed.has_value()) {
    app_.printError(closed.error());
    if (code == 0) {
      code = 1;
    }
  }

  if (options.json) {
    nlohmann::json output;
    output["command"] = command_[0];
    output["exit_code"] = code;
    output["cleaned_up"] = closed.has_value();
    nlohmann::json entry_paths = nlohmann::json::array();
    for (const auto& path : paths) {
      entry_paths.push_back(path.string());
    }
    output["entries"] = entry_paths;
    std::cout << output.dump(2) << "\n";
  }

  return code;
}

}  // namespace tempctx::cli
