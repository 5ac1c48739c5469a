#include "tempctx/common.hpp"

#include <sstream>

namespace tempctx {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kFileDeleteError:
      return "File delete error";
    case ErrorCode::kFilePermissionDenied:
      return "File permission denied";
    case ErrorCode::kDirectoryNotFound:
      return "Directory not found";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kProcessError:
      return "Process error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kIntegrityError:
      return "Integrity error";
    case ErrorCode::kNotFound:
      return "Not found";
  }
  return "Unknown error";
}

std::string Error::describe() const {
  std::string out;
  describeInto(out, 0);
  return out;
}

void Error::describeInto(std::string& out, int depth) const {
  if (depth > 0) {
    out += '\n';
    out.append(static_cast<size_t>(depth) * 2, ' ');
    out += "Caused by: ";
  }
  out += errorCodeToString(code_);
  out += ": ";
  out += message_;
  if (!path_.empty() && message_.find(path_.string()) == std::string::npos) {
    out += " [path: " + path_.string() + "]";
  }
  for (const auto& cause : causes_) {
    cause.describeInto(out, depth + 1);
  }
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
  return Version{0, 1, 0, ""};
}

}  // namespace tempctx
