#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tempctx {

// Error handling - using std::expected pattern
enum class ErrorCode {
  kSuccess = 0,
  kInvalidArgument,
  kFileNotFound,
  kFileWriteError,
  kFileDeleteError,
  kFilePermissionDenied,
  kDirectoryNotFound,
  kDirectoryCreateError,
  kConfigError,
  kSystemError,
  kProcessError,
  kInvalidState,
  kIntegrityError,
  kNotFound
};

// Convert error code to string
std::string_view errorCodeToString(ErrorCode code);

// Error class for detailed error information
class Error {
 public:
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::filesystem::path path)
      : code_(code), message_(std::move(message)), path_(std::move(path)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

  // Path the failed operation was acting on, empty when not path related
  const std::filesystem::path& path() const { return path_; }

  // Underlying failures: the wrapped cause of a single failure, or every
  // secondary failure of an aggregate one
  const std::vector<Error>& causes() const { return causes_; }
  void addCause(Error cause) { causes_.push_back(std::move(cause)); }

  // Message, path and every cause, one per indented line
  std::string describe() const;

 private:
  void describeInto(std::string& out, int depth) const;

  ErrorCode code_;
  std::string message_;
  std::filesystem::path path_;
  std::vector<Error> causes_;
};

// Result type alias
template <typename T>
using Result = std::expected<T, Error>;

// Convenience function for creating errors
inline Error makeError(ErrorCode code, const std::string& message) {
  return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message,
                       const std::filesystem::path& path) {
  return Error(code, message, path);
}

// Version information
struct Version {
  int major;
  int minor;
  int patch;
  std::string build;

  std::string toString() const;
};

// Get version information
Version getVersion();

}  // namespace tempctx
