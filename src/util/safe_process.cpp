#include "tempctx/util/safe_process.hpp"

#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>

#include "tempctx/util/logging.hpp"
#include "tempctx/util/signal_guard.hpp"

extern char **environ;

namespace tempctx::util {

namespace {

  bool isExecutable(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && (st.st_mode & S_IXUSR);
  }

  /**
   * @brief Null-terminated argv owning copies of its strings
   */
  class SafeArgvBuilder {
  private:
    std::vector<std::unique_ptr<char[]>> storage_;
    std::vector<char*> argv_;

  public:
    explicit SafeArgvBuilder(const std::vector<std::string>& strings) {
      storage_.reserve(strings.size());
      argv_.reserve(strings.size() + 1);

      for (const auto& str : strings) {
        auto len = str.length() + 1;
        auto buffer = std::make_unique<char[]>(len);
        std::memcpy(buffer.get(), str.c_str(), len);

        argv_.push_back(buffer.get());
        storage_.push_back(std::move(buffer));
      }
      argv_.push_back(nullptr);
    }

    char* const* data() { return argv_.data(); }
  };

}

std::optional<std::string> SafeProcess::findCommand(const std::string& command) {
  if (!SafeProcess::isValidCommand(command)) {
    return std::nullopt;
  }

  // Explicit path, absolute or relative to the working directory
  if (command.find('/') != std::string::npos) {
    if (isExecutable(command)) {
      return command;
    }
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (!path_env) {
    return std::nullopt;
  }

  std::istringstream path_stream{std::string(path_env)};
  std::string dir;

  while (std::getline(path_stream, dir, ':')) {
    if (dir.empty()) continue;

    std::string full_path = dir + "/" + command;
    if (isExecutable(full_path)) {
      return full_path;
    }
  }

  return std::nullopt;
}

bool SafeProcess::isValidCommand(const std::string& command) {
  if (command.empty() || command.length() > 255) {
    return false;
  }

  const std::string dangerous_chars = "|&;(){}[]<>*?~$`\"'\\";
  for (char c : command) {
    if (dangerous_chars.find(c) != std::string::npos) {
      return false;
    }
    if (static_cast<unsigned char>(c) < 32) {
      return false;
    }
  }

  return true;
}

bool SafeProcess::isValidArgument(const std::string& arg) {
  if (arg.length() > 4096) {
    return false;
  }

  for (char c : arg) {
    if (static_cast<unsigned char>(c) < 32 && c != '\t' && c != '\n' && c != '\r') {
      return false;
    }
  }

  return true;
}

Result<int> SafeProcess::run(const std::string& command, const std::vector<std::string>& args) {
  if (!SafeProcess::isValidCommand(command)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid command name: " + command));
  }

  for (const auto& arg : args) {
    if (!SafeProcess::isValidArgument(arg)) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid argument: " + arg.substr(0, 50) + "..."));
    }
  }

  auto command_path = findCommand(command);
  if (!command_path.has_value()) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Command not found: " + command));
  }

  std::vector<std::string> full_args;
  full_args.push_back(command);
  full_args.insert(full_args.end(), args.begin(), args.end());

  SafeArgvBuilder argv_builder(full_args);

  // Ignored dispositions survive exec, so reset everything a guard may catch
  sigset_t default_signals;
  sigemptyset(&default_signals);
  for (int guarded : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
    sigaddset(&default_signals, guarded);
  }

  posix_spawnattr_t attributes;
  posix_spawnattr_init(&attributes);
  posix_spawnattr_setsigdefault(&attributes, &default_signals);
  posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGDEF);

  pid_t pid;
  int spawn_result = posix_spawn(&pid, command_path->c_str(), nullptr, &attributes,
                                 argv_builder.data(), environ);

  posix_spawnattr_destroy(&attributes);

  if (spawn_result != 0) {
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Failed to spawn process: " + std::string(strerror(spawn_result))));
  }

  SignalGuard::setChild(pid);

  // A signal caught before the child existed still has to reach it
  if (int pending = SignalGuard::received(); pending != 0) {
    if (kill(pid, pending) != 0) {
      Logging::logger()->debug("Forwarding signal {} to {} failed: {}", pending, pid, strerror(errno));
    }
  }

  int status;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      SignalGuard::setChild(0);
      return std::unexpected(makeError(ErrorCode::kSystemError,
                                       "Failed to wait for process: " + std::string(strerror(errno))));
    }
  }
  SignalGuard::setChild(0);

  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return std::unexpected(makeError(ErrorCode::kProcessError,
                                   "Process ended without an exit status: " + command));
}

}  // namespace tempctx::util
