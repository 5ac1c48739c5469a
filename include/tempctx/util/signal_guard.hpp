#pragma once

#include <array>

#include <sys/types.h>

namespace tempctx::util {

/**
 * @brief Records SIGINT, SIGTERM, SIGHUP and SIGQUIT instead of dying while alive
 *
 * A signal that would otherwise kill the process with temporary entries still
 * on disk is noted and passed on to the child started by SafeProcess::run, if
 * one is running. The owner checks received() and shuts down normally, so
 * contexts get closed and the exit handlers run.
 *
 * Only one guard may be alive at a time. Previous handlers are restored on
 * destruction.
 */
class SignalGuard {
public:
  SignalGuard();
  ~SignalGuard();

  SignalGuard(const SignalGuard&) = delete;
  SignalGuard& operator=(const SignalGuard&) = delete;

  // Last signal caught by the live guard, 0 if none
  static int received();

  // Child that caught signals are forwarded to; 0 clears it
  static void setChild(pid_t pid);

private:
  using Handler = void (*)(int);

  std::array<Handler, 4> previous_;
};

}  // namespace tempctx::util
