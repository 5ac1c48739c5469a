#include "tempctx/core/temp_entry.hpp"

#include "tempctx/util/logging.hpp"

namespace tempctx::core {

TempEntry::TempEntry(TerminationRegistry& registry, ContextId context_id,
                     std::filesystem::path path, bool is_directory)
    : registry_(registry)
    , context_id_(context_id)
    , is_directory_(is_directory)
    , path_(std::move(path)) {}

TempEntry::~TempEntry() {
  auto result = close();
  if (!result.has_value()) {
    util::Logging::logger()->error("Closing abandoned temporary entry failed: {}",
                                   result.error().describe());
  }
}

Result<std::filesystem::path> TempEntry::path() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!path_.has_value()) {
    return std::unexpected(makeError(ErrorCode::kInvalidState, "Temp file closed"));
  }
  return *path_;
}

bool TempEntry::isClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !path_.has_value();
}

Result<void> TempEntry::close() {
  std::optional<std::filesystem::path> taken;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    taken.swap(path_);
  }
  if (!taken.has_value()) {
    return {};
  }

  // Neither the context close nor the exit sweep may revisit this path
  registry_.unregisterEntry(context_id_, taken->filename().string());

  auto result = deletePending(*taken, is_directory_);
  if (!result.has_value()) {
    return std::unexpected(deletionFailure(*taken, is_directory_, std::move(result.error())));
  }
  return {};
}

}  // namespace tempctx::core
