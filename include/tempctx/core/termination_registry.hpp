#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "tempctx/common.hpp"
#include "tempctx/core/termination_hook.hpp"

namespace tempctx::core {

// Opaque key of a TempContext; the registry never points at the context itself
using ContextId = std::uint64_t;

struct PendingDeletion {
  std::filesystem::path path;
  bool is_directory = false;
};

// Entry name -> pending deletion, ordered for deterministic iteration
using EntryMap = std::map<std::string, PendingDeletion>;

// Delete path if it still exists: recursively for directories, as a single
// file otherwise. Shared by entry close, context close and the exit sweep.
Result<void> deletePending(const std::filesystem::path& path, bool is_directory);

// The error reported to a caller whose close failed to delete path
Error deletionFailure(const std::filesystem::path& path, bool is_directory, Error cause);

/**
 * @brief Process-wide bookkeeping of temporary paths awaiting deletion
 *
 * Each context owns one entry map, locked independently of every other
 * context's map. The lookup table itself is only locked exclusively to add or
 * drop a context. The number of active contexts drives a shared termination
 * hook: installed on the 0 -> 1 transition, removed on 1 -> 0.
 */
class TerminationRegistry {
public:
  explicit TerminationRegistry(std::shared_ptr<TerminationHook> hook, ContextId first_id = 1);
  ~TerminationRegistry();

  TerminationRegistry(const TerminationRegistry&) = delete;
  TerminationRegistry& operator=(const TerminationRegistry&) = delete;

  // The registry used by contexts unless one is given explicitly. Its hook
  // runs the sweep from the process exit handlers.
  static TerminationRegistry& global();

  // Fresh context id; kIntegrityError once the id space is exhausted
  Result<ContextId> nextContextId();

  // Returns false when name is already registered for this context
  bool registerEntry(ContextId id, const std::string& name,
                     const std::filesystem::path& path, bool is_directory);

  void unregisterEntry(ContextId id, const std::string& name);

  // Remove and return everything registered for the context
  std::optional<EntryMap> takeAll(ContextId id);

  // Forget the context's slot if nothing is registered in it any more
  void releaseIfEmpty(ContextId id);

  size_t size(ContextId id) const;

  // Contexts that currently hold a slot, empty or not
  size_t contextCount() const;

  // Count one more active context, installing the hook on the first one.
  // Only counter overflow is an error; hook failures are logged.
  Result<void> installTerminationHookIfFirst();

  // Count one fewer active context, removing the hook after the last one
  void removeTerminationHookIfLast();

  int activeCount() const { return active_count_.load(); }
  bool hookInstalled() const;

  // Best-effort deletion of everything still registered. Runs at most once;
  // failures are logged, never returned.
  void runTerminationSweep();

private:
  struct ContextEntries {
    std::mutex mutex;
    EntryMap entries;
  };

  // Bring the hook state in line with the active count
  void reconcileHook();

  std::shared_ptr<TerminationHook> hook_;
  std::shared_ptr<spdlog::logger> logger_;

  std::atomic<ContextId> next_id_;
  std::atomic<int> active_count_{0};

  mutable std::shared_mutex contexts_mutex_;
  std::unordered_map<ContextId, std::unique_ptr<ContextEntries>> contexts_;

  mutable std::mutex hook_mutex_;
  bool hook_installed_ = false;

  std::atomic<bool> swept_{false};
};

}  // namespace tempctx::core
