#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tempctx::core {

inline constexpr std::string_view kDefaultPrefix = "tmp_";
inline constexpr std::string_view kDefaultSuffix = ".tmp";
inline constexpr size_t kMinPrefixLength = 3;
inline constexpr size_t kMaxPrefixLength = 64;

/**
 * @brief Prefix and suffix a temporary file derived from a name should use
 */
struct NameParts {
  std::string prefix;
  std::optional<std::string> suffix;  // nullopt: use kDefaultSuffix
};

/**
 * @brief Turn an arbitrary template into a safe temp file prefix
 *
 * - empty or absent: "tmp_"
 * - any character outside [a-zA-Z0-9._-] becomes '_'
 * - truncated to kMaxPrefixLength, then padded with '_' to kMinPrefixLength
 */
std::string sanitizePrefix(std::optional<std::string_view> name_template);

/**
 * @brief Split a file name into a prefix and an extension-preserving suffix
 *
 * The suffix is the longest trailing run of ".[a-zA-Z0-9_]*" segments, so
 * "archive.tar.gz" keeps ".tar.gz". A dot in the first position is never a
 * boundary, and the scan stops at a double dot. When a suffix is found the
 * prefix is the remaining leading part followed by '_'. The prefix is always
 * returned sanitized.
 */
NameParts splitName(std::string_view name);

}  // namespace tempctx::core
