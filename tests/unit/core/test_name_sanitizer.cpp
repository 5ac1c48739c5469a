#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tempctx/core/name_sanitizer.hpp"

using namespace tempctx::core;

class NameSanitizerTest : public ::testing::Test {
protected:
  static bool isSafe(const std::string& prefix) {
    for (char c : prefix) {
      bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
      if (!ok) return false;
    }
    return true;
  }

  const std::vector<std::string> samples_ = {
    "", "a", "ab", "abc", "report", "my file", "../../etc/passwd", "tab\there",
    "unicode-\xc3\xa9t\xc3\xa9", "dots...", "semi;colon|pipe", std::string(63, 'x'),
    std::string(64, 'y'), std::string(65, 'z'), std::string(200, '/'), "UPPER_lower-09.",
    std::string("nul\0byte", 8),
  };
};

TEST_F(NameSanitizerTest, DefaultPrefixForMissingOrEmptyTemplate) {
  EXPECT_EQ(sanitizePrefix(std::nullopt), "tmp_");
  EXPECT_EQ(sanitizePrefix(""), "tmp_");
}

TEST_F(NameSanitizerTest, ReplacesUnsafeCharacters) {
  EXPECT_EQ(sanitizePrefix("my file/name"), "my_file_name");
  EXPECT_EQ(sanitizePrefix("a$b*c"), "a_b_c");
  EXPECT_EQ(sanitizePrefix("../up"), ".._up");
}

TEST_F(NameSanitizerTest, KeepsSafeCharacters) {
  EXPECT_EQ(sanitizePrefix("Build-01.part_A"), "Build-01.part_A");
}

TEST_F(NameSanitizerTest, TruncatesLongTemplates) {
  auto prefix = sanitizePrefix(std::string(100, 'a'));
  EXPECT_EQ(prefix, std::string(64, 'a'));
}

TEST_F(NameSanitizerTest, PadsShortTemplates) {
  EXPECT_EQ(sanitizePrefix("a"), "a__");
  EXPECT_EQ(sanitizePrefix("ab"), "ab_");
  EXPECT_EQ(sanitizePrefix("abc"), "abc");
}

TEST_F(NameSanitizerTest, OutputIsBoundedSafeAndStable) {
  for (const auto& sample : samples_) {
    auto once = sanitizePrefix(sample);

    EXPECT_GE(once.size(), kMinPrefixLength) << "input: " << sample;
    EXPECT_LE(once.size(), kMaxPrefixLength) << "input: " << sample;
    EXPECT_TRUE(isSafe(once)) << "input: " << sample;
    EXPECT_EQ(sanitizePrefix(once), once) << "input: " << sample;
  }
}

TEST_F(NameSanitizerTest, SplitKeepsMultiPartExtension) {
  auto parts = splitName("archive.tar.gz");

  EXPECT_EQ(parts.prefix, "archive_");
  ASSERT_TRUE(parts.suffix.has_value());
  EXPECT_EQ(*parts.suffix, ".tar.gz");
}

TEST_F(NameSanitizerTest, SplitSingleExtension) {
  auto parts = splitName("report.csv");

  EXPECT_EQ(parts.prefix, "report_");
  ASSERT_TRUE(parts.suffix.has_value());
  EXPECT_EQ(*parts.suffix, ".csv");
}

TEST_F(NameSanitizerTest, SplitWithoutExtensionUsesDefaultSuffix) {
  auto parts = splitName("README");

  EXPECT_EQ(parts.prefix, "README");
  EXPECT_FALSE(parts.suffix.has_value());
}

TEST_F(NameSanitizerTest, SplitEmptyNameUsesDefaults) {
  auto parts = splitName("");

  EXPECT_EQ(parts.prefix, "tmp_");
  EXPECT_FALSE(parts.suffix.has_value());
}

TEST_F(NameSanitizerTest, LeadingDotIsNotAnExtension) {
  auto parts = splitName(".bashrc");

  EXPECT_EQ(parts.prefix, ".bashrc");
  EXPECT_FALSE(parts.suffix.has_value());
}

TEST_F(NameSanitizerTest, TrailingDotIsNotAnExtension) {
  auto parts = splitName("notes.");

  EXPECT_EQ(parts.prefix, "notes.");
  EXPECT_FALSE(parts.suffix.has_value());
}

TEST_F(NameSanitizerTest, ScanStopsAtDoubleDot) {
  auto parts = splitName("backup..tar");

  ASSERT_TRUE(parts.suffix.has_value());
  EXPECT_EQ(*parts.suffix, ".tar");
  EXPECT_EQ(parts.prefix, "backup._");
}

TEST_F(NameSanitizerTest, ScanStopsAtUnsafeCharacter) {
  // '-' is allowed in a prefix but not inside an extension
  auto parts = splitName("data.tar-gz");
  EXPECT_FALSE(parts.suffix.has_value());
  EXPECT_EQ(parts.prefix, "data.tar-gz");

  auto spaced = splitName("my report.txt");
  EXPECT_EQ(spaced.prefix, "my_report_");
  ASSERT_TRUE(spaced.suffix.has_value());
  EXPECT_EQ(*spaced.suffix, ".txt");
}

TEST_F(NameSanitizerTest, SplitPrefixIsSanitizedAndPadded) {
  auto parts = splitName("a.b");

  EXPECT_EQ(parts.prefix, "a__");
  ASSERT_TRUE(parts.suffix.has_value());
  EXPECT_EQ(*parts.suffix, ".b");
}
