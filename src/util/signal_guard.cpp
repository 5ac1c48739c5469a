#include "tempctx/util/signal_guard.hpp"

#include <csignal>

#include <signal.h>

namespace tempctx::util {

namespace {

constexpr std::array<int, 4> kGuardedSignals = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

volatile std::sig_atomic_t g_received = 0;
volatile std::sig_atomic_t g_child = 0;

void recordSignal(int signal) {
  g_received = signal;

  pid_t child = static_cast<pid_t>(g_child);
  if (child > 0) {
    kill(child, signal);
  }
}

}  // namespace

SignalGuard::SignalGuard() {
  g_received = 0;
  for (size_t i = 0; i < kGuardedSignals.size(); ++i) {
    previous_[i] = std::signal(kGuardedSignals[i], recordSignal);
  }
}

SignalGuard::~SignalGuard() {
  for (size_t i = 0; i < kGuardedSignals.size(); ++i) {
    std::signal(kGuardedSignals[i], previous_[i] == SIG_ERR ? SIG_DFL : previous_[i]);
  }
  g_child = 0;
  g_received = 0;
}

int SignalGuard::received() {
  return static_cast<int>(g_received);
}

void SignalGuard::setChild(pid_t pid) {
  g_child = static_cast<std::sig_atomic_t>(pid);
}

}  // namespace tempctx::util
