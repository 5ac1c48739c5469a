#include "tempctx/core/name_sanitizer.hpp"

#include <algorithm>

namespace tempctx::core {

namespace {

bool isSuffixChar(char ch) {
  return (ch >= 'a' && ch <= 'z')
      || (ch >= 'A' && ch <= 'Z')
      || (ch >= '0' && ch <= '9')
      || ch == '_';
}

bool isPrefixChar(char ch) {
  return isSuffixChar(ch) || ch == '.' || ch == '-';
}

}  // namespace

std::string sanitizePrefix(std::optional<std::string_view> name_template) {
  if (!name_template.has_value() || name_template->empty()) {
    return std::string(kDefaultPrefix);
  }

  size_t len = std::min(name_template->size(), kMaxPrefixLength);
  std::string prefix;
  prefix.reserve(std::max(len, kMinPrefixLength));
  for (size_t i = 0; i < len; ++i) {
    char ch = (*name_template)[i];
    prefix.push_back(isPrefixChar(ch) ? ch : '_');
  }
  while (prefix.size() < kMinPrefixLength) {
    prefix.push_back('_');
  }

  return prefix;
}

NameParts splitName(std::string_view name) {
  if (name.empty()) {
    return NameParts{sanitizePrefix(std::nullopt), std::nullopt};
  }

  size_t len = name.size();
  size_t last_dot = len;
  for (size_t i = len - 1; i > 0; --i) {
    char ch = name[i];
    if (ch == '.') {
      // End on double-dot (or a trailing dot)
      if (i == last_dot - 1) {
        break;
      }
      last_dot = i;
    } else if (!isSuffixChar(ch)) {
      break;
    }
  }

  if (last_dot == len) {
    return NameParts{sanitizePrefix(name), std::nullopt};
  }

  std::string prefix(name.substr(0, last_dot));
  prefix.push_back('_');
  return NameParts{sanitizePrefix(prefix), std::string(name.substr(last_dot))};
}

}  // namespace tempctx::core
