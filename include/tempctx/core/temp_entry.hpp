#pragma once

#include <filesystem>
#include <mutex>
#include <optional>

#include "tempctx/common.hpp"
#include "tempctx/core/termination_registry.hpp"

namespace tempctx::core {

/**
 * @brief A temporary file or directory deleted when closed
 *
 * Also deleted when the owning TempContext is closed, or at process exit if
 * neither happens first. Destroying an open entry closes it. Thread-safe:
 * concurrent close() calls agree on exactly one caller doing the deletion.
 *
 * The registry must outlive the entry.
 */
class TempEntry {
public:
  TempEntry(TerminationRegistry& registry, ContextId context_id,
            std::filesystem::path path, bool is_directory);
  ~TempEntry();

  TempEntry(const TempEntry&) = delete;
  TempEntry& operator=(const TempEntry&) = delete;
  TempEntry(TempEntry&&) = delete;
  TempEntry& operator=(TempEntry&&) = delete;

  // kInvalidState once closed
  Result<std::filesystem::path> path() const;

  bool isDirectory() const { return is_directory_; }
  ContextId contextId() const { return context_id_; }
  bool isClosed() const;

  // De-register and delete the path. A second call does nothing.
  Result<void> close();

private:
  TerminationRegistry& registry_;
  const ContextId context_id_;
  const bool is_directory_;

  mutable std::mutex mutex_;
  std::optional<std::filesystem::path> path_;
};

}  // namespace tempctx::core
