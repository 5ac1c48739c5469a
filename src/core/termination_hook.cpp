#include "tempctx/core/termination_hook.hpp"

#include <cstdlib>

namespace tempctx::core {

namespace {

void runProcessExitHook() {
  ProcessExitHook::instance()->fire();
}

}  // namespace

std::shared_ptr<ProcessExitHook> ProcessExitHook::instance() {
  static std::shared_ptr<ProcessExitHook> instance_ =
    std::make_shared<ProcessExitHook>(ConstructionKey{});
  return instance_;
}

Result<void> ProcessExitHook::install(Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (callback_) {
    return std::unexpected(makeError(ErrorCode::kInvalidState,
                                     "A process exit callback is already installed"));
  }

  if (!handlers_registered_) {
    if (std::atexit(runProcessExitHook) != 0) {
      return std::unexpected(makeError(ErrorCode::kSystemError,
                                       "Failed to register atexit handler"));
    }
    if (std::at_quick_exit(runProcessExitHook) != 0) {
      return std::unexpected(makeError(ErrorCode::kSystemError,
                                       "Failed to register at_quick_exit handler"));
    }
    handlers_registered_ = true;
  }

  callback_ = std::move(callback);
  fired_ = false;
  return {};
}

Result<void> ProcessExitHook::remove() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!callback_) {
    if (fired_) {
      return {};
    }
    return std::unexpected(makeError(ErrorCode::kInvalidState,
                                     "No process exit callback is installed"));
  }

  callback_ = nullptr;
  return {};
}

void ProcessExitHook::fire() {
  Callback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback.swap(callback_);
    fired_ = fired_ || static_cast<bool>(callback);
  }

  if (callback) {
    callback();
  }
}

}  // namespace tempctx::core
