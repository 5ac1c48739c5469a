#pragma once

#include <functional>
#include <memory>
#include <mutex>

#include "tempctx/common.hpp"

namespace tempctx::core {

/**
 * @brief A slot for one callback that runs when the process terminates
 *
 * The registry installs its sweep while at least one context is active and
 * removes it when the last one closes.
 */
class TerminationHook {
public:
  using Callback = std::function<void()>;

  virtual ~TerminationHook() = default;

  virtual Result<void> install(Callback callback) = 0;
  virtual Result<void> remove() = 0;
};

/**
 * @brief Termination hook backed by std::atexit and std::at_quick_exit
 *
 * C handlers cannot be unregistered, so they are registered once per process
 * and forward to whatever callback is installed at exit time. The callback
 * runs at most once.
 */
class ProcessExitHook : public TerminationHook {
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

public:
  static std::shared_ptr<ProcessExitHook> instance();

  explicit ProcessExitHook(ConstructionKey) {}

  Result<void> install(Callback callback) override;
  Result<void> remove() override;

  // Run and clear the installed callback, if any. A remove() after the
  // callback has fired succeeds.
  void fire();

private:
  std::mutex mutex_;
  Callback callback_;
  bool handlers_registered_ = false;
  bool fired_ = false;
};

}  // namespace tempctx::core
