#include "tempctx/util/filesystem.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tempctx::util {

namespace {

constexpr const char* kRandomSegment = "XXXXXX";

// mkstemps/mkdtemp rewrite their template in place
std::vector<char> makeTemplate(const std::filesystem::path& path) {
  std::string str = path.string();
  return std::vector<char>(str.c_str(), str.c_str() + str.size() + 1);
}

bool hasSeparator(const std::string& component) {
  return component.find('/') != std::string::npos ||
         component.find('\0') != std::string::npos;
}

// Remove a staging file after a failed write, keeping any cleanup failure
Error discardStaging(const std::filesystem::path& staging, Error error) {
  std::error_code ec;
  if (!std::filesystem::remove(staging, ec) && ec) {
    error.addCause(makeError(ErrorCode::kFileDeleteError,
                             "Cannot remove " + staging.string() + ": " + ec.message(),
                             staging));
  }
  return error;
}

}  // namespace

Result<std::filesystem::path> FileSystem::createUniqueFile(const std::filesystem::path& parent,
                                                           const std::string& prefix,
                                                           const std::string& suffix) {
  if (hasSeparator(prefix) || hasSeparator(suffix)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Temporary file prefix and suffix must not contain a path separator"));
  }

  auto buffer = makeTemplate(parent / (prefix + kRandomSegment + suffix));
  int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create temporary file in " + parent.string() +
                                     ": " + std::strerror(errno),
                                     parent));
  }
  close(fd);

  return std::filesystem::path(buffer.data());
}

Result<std::filesystem::path> FileSystem::createUniqueDirectory(const std::filesystem::path& parent,
                                                                const std::string& prefix) {
  if (hasSeparator(prefix)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Temporary directory prefix must not contain a path separator"));
  }

  auto buffer = makeTemplate(parent / (prefix + kRandomSegment));
  if (mkdtemp(buffer.data()) == nullptr) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot create temporary directory in " + parent.string() +
                                     ": " + std::strerror(errno),
                                     parent));
  }

  return std::filesystem::path(buffer.data());
}

Result<void> FileSystem::deletePath(const std::filesystem::path& path) {
  std::error_code ec;
  bool removed = std::filesystem::remove(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileDeleteError,
                                     "Cannot remove " + path.string() + ": " + ec.message(),
                                     path));
  }
  if (!removed) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot remove " + path.string() + ": no such file or directory",
                                     path));
  }

  return {};
}

Result<void> FileSystem::deleteRecursive(const std::filesystem::path& path) {
  std::error_code ec;
  auto status = std::filesystem::symlink_status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot remove " + path.string() + ": no such file or directory",
                                     path));
  }

  if (std::filesystem::is_directory(status)) {
    // Snapshot the children so removal does not race the directory stream
    std::vector<std::filesystem::path> children;
    for (std::filesystem::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
      children.push_back(it->path());
    }
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kFileDeleteError,
                                       "Cannot list directory " + path.string() + ": " + ec.message(),
                                       path));
    }

    for (const auto& child : children) {
      auto result = deleteRecursive(child);
      if (!result.has_value()) {
        return result;
      }
    }
  }

  auto result = deletePath(path);
  if (!result.has_value()) {
    return result;
  }

  if (exists(path)) {
    return std::unexpected(makeError(ErrorCode::kFileDeleteError,
                                     "Path still exists after recursive delete: " + path.string(),
                                     path));
  }

  return {};
}

bool FileSystem::exists(const std::filesystem::path& path) {
  std::error_code ec;
  auto status = std::filesystem::symlink_status(path, ec);
  return !ec && std::filesystem::exists(status);
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path,
                                           std::filesystem::perms perms) {
  std::error_code ec;

  if (!std::filesystem::create_directories(path, ec) && ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot create directories: " + ec.message(),
                                     path));
  }

  // Set permissions
  std::filesystem::permissions(path, perms, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFilePermissionDenied,
                                     "Cannot set directory permissions: " + ec.message(),
                                     path));
  }

  return {};
}

Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  auto parent = path.parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  if (!exists(parent)) {
    auto created = createDirectories(parent);
    if (!created.has_value()) {
      return created;
    }
  }

  auto staging = createUniqueFile(parent, "." + path.filename().string() + ".", ".tmp");
  if (!staging.has_value()) {
    return std::unexpected(staging.error());
  }

  {
    std::ofstream file(*staging, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
      return std::unexpected(discardStaging(*staging,
                                            makeError(ErrorCode::kFileWriteError,
                                                      "Failed to write " + staging->string(),
                                                      *staging)));
    }
  }

  int fd = open(staging->c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }

  std::error_code ec;
  std::filesystem::rename(*staging, path, ec);
  if (ec) {
    return std::unexpected(discardStaging(*staging,
                                          makeError(ErrorCode::kFileWriteError,
                                                    "Cannot replace " + path.string() + ": " + ec.message(),
                                                    path)));
  }

  return {};
}

Result<void> FileSystem::validateDirectory(const std::filesystem::path& path) {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);

  if (ec || !std::filesystem::exists(status)) {
    return std::unexpected(makeError(ErrorCode::kDirectoryNotFound,
                                     "Directory does not exist: " + path.string(),
                                     path));
  }
  if (!std::filesystem::is_directory(status)) {
    return std::unexpected(makeError(ErrorCode::kDirectoryNotFound,
                                     "Not a directory: " + path.string(),
                                     path));
  }
  if (access(path.c_str(), R_OK) != 0) {
    return std::unexpected(makeError(ErrorCode::kFilePermissionDenied,
                                     "Directory is not readable: " + path.string(),
                                     path));
  }
  if (access(path.c_str(), W_OK) != 0) {
    return std::unexpected(makeError(ErrorCode::kFilePermissionDenied,
                                     "Directory is not writable: " + path.string(),
                                     path));
  }

  return {};
}

}  // namespace tempctx::util
