#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tempctx/common.hpp"
#include "tempctx/core/temp_entry.hpp"
#include "tempctx/core/termination_registry.hpp"

namespace tempctx::core {

/**
 * @brief Session-scoped manager of temporary files and directories
 *
 * Every entry it creates is registered for deletion at process exit and
 * de-registered as soon as the entry is closed, so the registry only ever
 * holds paths still alive. close() deletes whatever is left; if this was the
 * last active context the shared termination hook is removed as well.
 *
 * Thread-safe. Destroying an open context closes it.
 */
class TempContext {
  // Keeps construction behind create() while still allowing std::make_unique
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

public:
  /**
   * @brief Create an active context
   * @param base_dir Directory new entries are created in; the system default
   *                 when absent
   * @param registry Registry tracking pending deletions; must outlive the
   *                 context and its entries
   * @return kConfigError if the default directory is unusable, kIntegrityError
   *         on counter wraparound
   */
  static Result<std::unique_ptr<TempContext>> create(
    std::optional<std::filesystem::path> base_dir = std::nullopt,
    TerminationRegistry& registry = TerminationRegistry::global());

  /**
   * @brief System temporary directory, resolved and validated once per process
   *
   * Created (with parents) when missing. Must be a readable and writable
   * directory, else kConfigError. Only a successful resolution is cached.
   */
  static Result<std::filesystem::path> defaultBaseDirectory();

  TempContext(ConstructionKey, TerminationRegistry& registry, ContextId id,
              std::filesystem::path base_dir);
  ~TempContext();

  TempContext(const TempContext&) = delete;
  TempContext& operator=(const TempContext&) = delete;
  TempContext(TempContext&&) = delete;
  TempContext& operator=(TempContext&&) = delete;

  const std::filesystem::path& baseDirectory() const { return base_dir_; }
  ContextId id() const { return id_; }
  bool isClosed() const { return closed_.load(); }

  /**
   * @brief Create a temporary file named prefix + random segment + suffix
   * @param prefix Sanitized with sanitizePrefix(); "tmp_" when absent
   * @param suffix ".tmp" when absent; must not contain '/'
   */
  Result<std::unique_ptr<TempEntry>> createTempFile(std::optional<std::string_view> prefix,
                                                    std::optional<std::string_view> suffix);

  // Default prefix and suffix
  Result<std::unique_ptr<TempEntry>> createTempFile();

  // Prefix and extension-preserving suffix derived from name (see splitName)
  Result<std::unique_ptr<TempEntry>> createTempFile(std::string_view name);

  // Temporary directory, deleted recursively
  Result<std::unique_ptr<TempEntry>> createTempDirectory(
    std::optional<std::string_view> prefix = std::nullopt);

  // Entries created and not yet closed
  size_t size() const;

  /**
   * @brief Close the context, deleting every entry it still owns
   *
   * Idempotent. Every entry is attempted; one failure is reported as that
   * entry's kFileDeleteError, several as one aggregate kFileDeleteError
   * carrying each failure as a cause. Entries that failed are no longer
   * tracked and are not retried by a later close.
   */
  Result<void> close();

private:
  Result<std::unique_ptr<TempEntry>> createEntry(bool is_directory, const std::string& prefix,
                                                 const std::string& suffix);

  TerminationRegistry& registry_;
  const ContextId id_;
  const std::filesystem::path base_dir_;
  std::atomic<bool> closed_{false};
};

}  // namespace tempctx::core
