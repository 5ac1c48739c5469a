#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tempctx/common.hpp"

namespace tempctx::util {

/**
 * @brief Process execution without a shell
 *
 * The command and its arguments are handed to posix_spawn as-is, so nothing
 * in them is ever interpreted by /bin/sh.
 */
class SafeProcess {
public:
  /**
   * @brief Execute a command attached to this process's stdin, stdout and stderr
   *
   * The child starts with default dispositions for the signals a SignalGuard
   * catches. While it runs, a live SignalGuard forwards those signals to it.
   *
   * @param command Command name looked up in PATH, or a path containing '/'
   * @return Exit code of the command; 128 + signal number if it was killed.
   *         kInvalidArgument, kNotFound, kProcessError or kSystemError when it
   *         could not be run.
   */
  static Result<int> run(const std::string& command,
                         const std::vector<std::string>& args = {});

  /**
   * @brief Find the full path of a command
   * @return Full path to command or nullopt if not found
   */
  static std::optional<std::string> findCommand(const std::string& command);

  // Non-empty, at most 255 bytes, no shell metacharacters or control characters
  static bool isValidCommand(const std::string& command);

  // At most 4096 bytes, no control characters besides tab, newline and CR
  static bool isValidArgument(const std::string& arg);

private:
  SafeProcess() = default;
};

}  // namespace tempctx::util
