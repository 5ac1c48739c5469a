#include "tempctx/core/termination_registry.hpp"

#include <limits>

#include "tempctx/util/filesystem.hpp"
#include "tempctx/util/logging.hpp"

namespace tempctx::core {

Result<void> deletePending(const std::filesystem::path& path, bool is_directory) {
  if (!util::FileSystem::exists(path)) {
    return {};
  }

  if (is_directory) {
    return util::FileSystem::deleteRecursive(path);
  }
  return util::FileSystem::deletePath(path);
}

Error deletionFailure(const std::filesystem::path& path, bool is_directory, Error cause) {
  Error error(ErrorCode::kFileDeleteError,
              std::string("Unable to delete temporary ") + (is_directory ? "directory" : "file") +
              ": " + path.string(),
              path);
  error.addCause(std::move(cause));
  return error;
}

TerminationRegistry::TerminationRegistry(std::shared_ptr<TerminationHook> hook, ContextId first_id)
    : hook_(std::move(hook))
    , logger_(util::Logging::logger())
    , next_id_(first_id) {}

TerminationRegistry::~TerminationRegistry() {
  std::lock_guard<std::mutex> lock(hook_mutex_);
  // After the sweep the hook has already been consumed
  if (hook_installed_ && !swept_.load()) {
    auto result = hook_->remove();
    if (!result.has_value()) {
      logger_->warn("Failed to remove termination hook: {}", result.error().message());
    }
    hook_installed_ = false;
  }
}

TerminationRegistry& TerminationRegistry::global() {
  static TerminationRegistry registry(ProcessExitHook::instance());
  return registry;
}

Result<ContextId> TerminationRegistry::nextContextId() {
  ContextId current = next_id_.load();
  do {
    if (current == std::numeric_limits<ContextId>::max()) {
      return std::unexpected(makeError(ErrorCode::kIntegrityError,
                                       "Context id generator wraparound detected"));
    }
  } while (!next_id_.compare_exchange_weak(current, current + 1));

  return current;
}

bool TerminationRegistry::registerEntry(ContextId id, const std::string& name,
                                        const std::filesystem::path& path, bool is_directory) {
  while (true) {
    {
      std::shared_lock<std::shared_mutex> lock(contexts_mutex_);
      auto it = contexts_.find(id);
      if (it != contexts_.end()) {
        std::lock_guard<std::mutex> entries_lock(it->second->mutex);
        return it->second->entries.try_emplace(name, PendingDeletion{path, is_directory}).second;
      }
    }

    std::unique_lock<std::shared_mutex> lock(contexts_mutex_);
    contexts_.try_emplace(id, std::make_unique<ContextEntries>());
  }
}

void TerminationRegistry::unregisterEntry(ContextId id, const std::string& name) {
  std::shared_lock<std::shared_mutex> lock(contexts_mutex_);
  auto it = contexts_.find(id);
  if (it != contexts_.end()) {
    std::lock_guard<std::mutex> entries_lock(it->second->mutex);
    it->second->entries.erase(name);
  }
}

std::optional<EntryMap> TerminationRegistry::takeAll(ContextId id) {
  std::unique_ptr<ContextEntries> taken;
  {
    std::unique_lock<std::shared_mutex> lock(contexts_mutex_);
    auto it = contexts_.find(id);
    if (it == contexts_.end()) {
      return std::nullopt;
    }
    taken = std::move(it->second);
    contexts_.erase(it);
  }

  std::lock_guard<std::mutex> entries_lock(taken->mutex);
  return std::move(taken->entries);
}

void TerminationRegistry::releaseIfEmpty(ContextId id) {
  std::unique_lock<std::shared_mutex> lock(contexts_mutex_);
  auto it = contexts_.find(id);
  if (it == contexts_.end()) {
    return;
  }

  std::unique_lock<std::mutex> entries_lock(it->second->mutex);
  if (it->second->entries.empty()) {
    entries_lock.unlock();
    contexts_.erase(it);
  }
}

size_t TerminationRegistry::contextCount() const {
  std::shared_lock<std::shared_mutex> lock(contexts_mutex_);
  return contexts_.size();
}

size_t TerminationRegistry::size(ContextId id) const {
  std::shared_lock<std::shared_mutex> lock(contexts_mutex_);
  auto it = contexts_.find(id);
  if (it == contexts_.end()) {
    return 0;
  }

  std::lock_guard<std::mutex> entries_lock(it->second->mutex);
  return it->second->entries.size();
}

Result<void> TerminationRegistry::installTerminationHookIfFirst() {
  int current = active_count_.load();
  do {
    if (current == std::numeric_limits<int>::max()) {
      return std::unexpected(makeError(ErrorCode::kIntegrityError,
                                       "Active context count wraparound detected"));
    }
  } while (!active_count_.compare_exchange_weak(current, current + 1));

  logger_->trace("activeCount={}", current + 1);
  if (current == 0) {
    reconcileHook();
  }
  return {};
}

void TerminationRegistry::removeTerminationHookIfLast() {
  int current = active_count_.load();
  do {
    if (current <= 0) {
      logger_->error("Active context count underflow ignored");
      return;
    }
  } while (!active_count_.compare_exchange_weak(current, current - 1));

  logger_->trace("activeCount={}", current - 1);
  if (current == 1) {
    reconcileHook();
  }
}

bool TerminationRegistry::hookInstalled() const {
  std::lock_guard<std::mutex> lock(hook_mutex_);
  return hook_installed_;
}

void TerminationRegistry::reconcileHook() {
  std::lock_guard<std::mutex> lock(hook_mutex_);
  bool wanted = active_count_.load() > 0;

  if (wanted && !hook_installed_) {
    logger_->debug("Registering termination hook");
    auto result = hook_->install([this]() { runTerminationSweep(); });
    if (result.has_value()) {
      hook_installed_ = true;
    } else {
      logger_->warn("Failed to add termination hook: {}", result.error().message());
    }
  } else if (!wanted && hook_installed_) {
    logger_->debug("Removing termination hook");
    auto result = hook_->remove();
    if (result.has_value()) {
      hook_installed_ = false;
    } else {
      logger_->warn("Failed to remove termination hook: {}", result.error().message());
    }
  }
}

void TerminationRegistry::runTerminationSweep() {
  if (swept_.exchange(true)) {
    return;
  }

  std::shared_lock<std::shared_mutex> lock(contexts_mutex_);
  for (auto& [id, context_entries] : contexts_) {
    std::lock_guard<std::mutex> entries_lock(context_entries->mutex);
    for (const auto& [name, pending] : context_entries->entries) {
      auto result = deletePending(pending.path, pending.is_directory);
      if (!result.has_value()) {
        logger_->warn("Unable to delete {} on shutdown: {}",
                      pending.is_directory ? "directory" : "file",
                      result.error().describe());
      }
    }
    context_entries->entries.clear();
  }

  logger_->flush();
}

}  // namespace tempctx::core
