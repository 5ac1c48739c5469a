#pragma once

#include <filesystem>
#include <string>

#include "tempctx/common.hpp"

namespace tempctx::util {

// Filesystem primitives used by the temp file lifecycle manager
class FileSystem {
 public:
  // Create a new, previously nonexistent regular file under parent whose
  // name is prefix + random segment + suffix
  static Result<std::filesystem::path> createUniqueFile(const std::filesystem::path& parent,
                                                        const std::string& prefix,
                                                        const std::string& suffix);

  // Create a new, previously nonexistent directory under parent whose name is
  // prefix + random segment
  static Result<std::filesystem::path> createUniqueDirectory(const std::filesystem::path& parent,
                                                             const std::string& prefix);

  // Remove a single file, symlink or empty directory. Fails when the path
  // does not exist or cannot be removed.
  static Result<void> deletePath(const std::filesystem::path& path);

  // Remove a directory tree, contents before their directory. Symlinks are
  // removed, never followed. The first failed removal fails the whole call;
  // on success the path no longer exists.
  static Result<void> deleteRecursive(const std::filesystem::path& path);

  // True when something (including a dangling symlink) exists at path
  static bool exists(const std::filesystem::path& path);

  // Create directory with proper permissions
  static Result<void> createDirectories(const std::filesystem::path& path,
                                        std::filesystem::perms perms = std::filesystem::perms::owner_all);

  // Write content to a sibling staging file, sync it and rename it over path
  static Result<void> writeFileAtomic(const std::filesystem::path& path, const std::string& content);

  // Check that path is an existing directory we can read and write
  static Result<void> validateDirectory(const std::filesystem::path& path);
};

}  // namespace tempctx::util
