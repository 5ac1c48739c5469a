#include "tempctx/core/temp_context.hpp"

#include <mutex>
#include <utility>
#include <vector>

#include "tempctx/core/name_sanitizer.hpp"
#include "tempctx/util/environment.hpp"
#include "tempctx/util/filesystem.hpp"
#include "tempctx/util/logging.hpp"

namespace tempctx::core {

namespace {

Error configurationError(const std::filesystem::path& dir, Error cause) {
  Error error(ErrorCode::kConfigError,
              "System temp directory is not usable: " + dir.string(),
              dir);
  error.addCause(std::move(cause));
  return error;
}

}  // namespace

Result<std::filesystem::path> TempContext::defaultBaseDirectory() {
  static std::mutex mutex;
  static std::optional<std::filesystem::path> cached;

  std::lock_guard<std::mutex> lock(mutex);
  if (cached.has_value()) {
    return *cached;
  }

  auto dir = util::Environment::tempDirectory();
  if (!util::FileSystem::exists(dir)) {
    auto created = util::FileSystem::createDirectories(dir);
    if (!created.has_value()) {
      return std::unexpected(configurationError(dir, std::move(created.error())));
    }
  }

  auto valid = util::FileSystem::validateDirectory(dir);
  if (!valid.has_value()) {
    return std::unexpected(configurationError(dir, std::move(valid.error())));
  }

  cached = dir;
  return dir;
}

Result<std::unique_ptr<TempContext>> TempContext::create(
    std::optional<std::filesystem::path> base_dir,
    TerminationRegistry& registry) {
  std::filesystem::path dir;
  if (base_dir.has_value()) {
    dir = std::move(*base_dir);
  } else {
    auto resolved = defaultBaseDirectory();
    if (!resolved.has_value()) {
      return std::unexpected(resolved.error());
    }
    dir = std::move(*resolved);
  }

  auto id = registry.nextContextId();
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto activated = registry.installTerminationHookIfFirst();
  if (!activated.has_value()) {
    return std::unexpected(activated.error());
  }

  return std::make_unique<TempContext>(ConstructionKey{}, registry, *id, std::move(dir));
}

TempContext::TempContext(ConstructionKey, TerminationRegistry& registry, ContextId id,
                         std::filesystem::path base_dir)
    : registry_(registry)
    , id_(id)
    , base_dir_(std::move(base_dir)) {}

TempContext::~TempContext() {
  auto result = close();
  if (!result.has_value()) {
    util::Logging::logger()->error("Closing abandoned temp context {} failed: {}",
                                   id_, result.error().describe());
  }
}

Result<std::unique_ptr<TempEntry>> TempContext::createTempFile(std::optional<std::string_view> prefix,
                                                               std::optional<std::string_view> suffix) {
  return createEntry(false,
                     sanitizePrefix(prefix),
                     std::string(suffix.value_or(kDefaultSuffix)));
}

Result<std::unique_ptr<TempEntry>> TempContext::createTempFile() {
  return createTempFile(std::nullopt, std::nullopt);
}

Result<std::unique_ptr<TempEntry>> TempContext::createTempFile(std::string_view name) {
  auto parts = splitName(name);
  return createEntry(false,
                     parts.prefix,
                     parts.suffix.value_or(std::string(kDefaultSuffix)));
}

Result<std::unique_ptr<TempEntry>> TempContext::createTempDirectory(std::optional<std::string_view> prefix) {
  return createEntry(true, sanitizePrefix(prefix), "");
}

Result<std::unique_ptr<TempEntry>> TempContext::createEntry(bool is_directory,
                                                            const std::string& prefix,
                                                            const std::string& suffix) {
  if (closed_.load()) {
    return std::unexpected(makeError(ErrorCode::kInvalidState, "Temp context is closed"));
  }

  while (true) {
    auto created = is_directory
      ? util::FileSystem::createUniqueDirectory(base_dir_, prefix)
      : util::FileSystem::createUniqueFile(base_dir_, prefix, suffix);
    if (!created.has_value()) {
      return std::unexpected(created.error());
    }

    const std::filesystem::path& path = *created;
    std::string name = path.filename().string();

    if (registry_.registerEntry(id_, name, path, is_directory)) {
      // Lost a race with close(): nothing will delete this path but us
      if (closed_.load()) {
        registry_.unregisterEntry(id_, name);
        registry_.releaseIfEmpty(id_);
        Error error = makeError(ErrorCode::kInvalidState, "Temp context is closed");
        auto removed = deletePending(path, is_directory);
        if (!removed.has_value()) {
          error.addCause(std::move(removed.error()));
        }
        return std::unexpected(std::move(error));
      }
      return std::make_unique<TempEntry>(registry_, id_, path, is_directory);
    }

    // Name already tracked by this context, try another one
    util::Logging::logger()->debug("Temporary name collision in context {}: {}", id_, name);
    auto removed = util::FileSystem::deletePath(path);
    if (!removed.has_value()) {
      return std::unexpected(removed.error());
    }
  }
}

size_t TempContext::size() const {
  return registry_.size(id_);
}

Result<void> TempContext::close() {
  if (closed_.exchange(true)) {
    return {};
  }

  auto taken = registry_.takeAll(id_);
  registry_.removeTerminationHookIfLast();

  if (!taken.has_value()) {
    return {};
  }

  std::vector<std::pair<PendingDeletion, Error>> failures;
  for (const auto& [name, pending] : *taken) {
    auto result = deletePending(pending.path, pending.is_directory);
    if (!result.has_value()) {
      failures.emplace_back(pending, std::move(result.error()));
    }
  }

  if (failures.empty()) {
    return {};
  }

  if (failures.size() == 1) {
    auto& [pending, cause] = failures.front();
    return std::unexpected(deletionFailure(pending.path, pending.is_directory, std::move(cause)));
  }

  std::string message = "Unable to delete temporary directories/files:";
  for (const auto& [pending, cause] : failures) {
    message += "\n    " + pending.path.string();
  }
  Error aggregate(ErrorCode::kFileDeleteError, message);
  for (auto& [pending, cause] : failures) {
    aggregate.addCause(std::move(cause));
  }
  return std::unexpected(std::move(aggregate));
}

}  // namespace tempctx::core
