#include <gtest/gtest.h>

#include <filesystem>
#include <set>

#include <unistd.h>

#include "tempctx/util/filesystem.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace tempctx::util;
using namespace tempctx::test;
using tempctx::ErrorCode;

class FileSystemTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<TempDirectory>();
  }

  void TearDown() override {
    temp_dir_.reset();
  }

  std::unique_ptr<TempDirectory> temp_dir_;
};

TEST_F(FileSystemTest, CreateUniqueFileUsesPrefixAndSuffix) {
  auto created = FileSystem::createUniqueFile(temp_dir_->path(), "pre_", ".ext");
  ASSERT_OK(created);

  auto name = created->filename().string();
  EXPECT_EQ(created->parent_path(), temp_dir_->path());
  EXPECT_EQ(name.rfind("pre_", 0), 0u) << name;
  EXPECT_EQ(name.substr(name.size() - 4), ".ext");
  EXPECT_EQ(name.size(), std::string("pre_").size() + 6 + std::string(".ext").size());
  EXPECT_TRUE(std::filesystem::is_regular_file(*created));
  EXPECT_EQ(std::filesystem::file_size(*created), 0u);
}

TEST_F(FileSystemTest, CreateUniqueFileNeverReusesAName) {
  std::set<std::filesystem::path> seen;
  for (int i = 0; i < 50; ++i) {
    auto created = FileSystem::createUniqueFile(temp_dir_->path(), "dup", "");
    ASSERT_OK(created);
    EXPECT_TRUE(seen.insert(*created).second) << *created;
  }
}

TEST_F(FileSystemTest, CreateUniqueFileRejectsSeparators) {
  EXPECT_ERROR(FileSystem::createUniqueFile(temp_dir_->path(), "a/b", ".tmp"),
               ErrorCode::kInvalidArgument);
  EXPECT_ERROR(FileSystem::createUniqueFile(temp_dir_->path(), "ok", "/x"),
               ErrorCode::kInvalidArgument);
  EXPECT_EQ(temp_dir_->entryCount(), 0u);
}

TEST_F(FileSystemTest, CreateUniqueFileInMissingDirectoryFails) {
  auto result = FileSystem::createUniqueFile(temp_dir_->path() / "missing", "x__", ".tmp");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kFileWriteError);
  EXPECT_EQ(result.error().path(), temp_dir_->path() / "missing");
}

TEST_F(FileSystemTest, CreateUniqueDirectory) {
  auto created = FileSystem::createUniqueDirectory(temp_dir_->path(), "dir_");
  ASSERT_OK(created);

  EXPECT_TRUE(std::filesystem::is_directory(*created));
  EXPECT_EQ(created->filename().string().rfind("dir_", 0), 0u);
}

TEST_F(FileSystemTest, DeletePathRemovesFile) {
  auto file = temp_dir_->createFile("victim.txt", "x");

  EXPECT_OK(FileSystem::deletePath(file));
  EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(FileSystemTest, DeletePathOnMissingPathIsNotFound) {
  EXPECT_ERROR(FileSystem::deletePath(temp_dir_->path() / "ghost"), ErrorCode::kFileNotFound);
}

TEST_F(FileSystemTest, DeletePathRefusesNonEmptyDirectory) {
  auto dir = temp_dir_->createSubdir("full");
  temp_dir_->createFile("full/item.txt");

  auto result = FileSystem::deletePath(dir);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kFileDeleteError);
  EXPECT_EQ(result.error().path(), dir);
  EXPECT_TRUE(std::filesystem::exists(dir));
}

TEST_F(FileSystemTest, DeleteRecursiveRemovesTree) {
  auto dir = temp_dir_->createSubdir("tree");
  std::filesystem::create_directories(dir / "a" / "b" / "c");
  temp_dir_->createFile("tree/top.txt");
  temp_dir_->createFile("tree/a/b/c/leaf.txt");
  temp_dir_->createSubdir("tree/empty");

  EXPECT_OK(FileSystem::deleteRecursive(dir));
  EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(FileSystemTest, DeleteRecursiveDoesNotFollowSymlinks) {
  auto outside = temp_dir_->createSubdir("outside");
  auto precious = temp_dir_->createFile("outside/precious.txt", "keep me");
  auto dir = temp_dir_->createSubdir("tree");
  std::filesystem::create_directory_symlink(outside, dir / "link");

  EXPECT_OK(FileSystem::deleteRecursive(dir));

  EXPECT_FALSE(std::filesystem::exists(dir));
  EXPECT_TRUE(std::filesystem::exists(precious));
}

TEST_F(FileSystemTest, DeleteRecursiveOnFileRemovesIt) {
  auto file = temp_dir_->createFile("single.txt");

  EXPECT_OK(FileSystem::deleteRecursive(file));
  EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(FileSystemTest, DeleteRecursiveOnMissingPathIsNotFound) {
  EXPECT_ERROR(FileSystem::deleteRecursive(temp_dir_->path() / "ghost"), ErrorCode::kFileNotFound);
}

TEST_F(FileSystemTest, ExistsSeesDanglingSymlinks) {
  auto link = temp_dir_->path() / "dangling";
  std::filesystem::create_symlink(temp_dir_->path() / "nowhere", link);

  EXPECT_TRUE(FileSystem::exists(link));
  EXPECT_FALSE(FileSystem::exists(temp_dir_->path() / "nowhere"));
}

TEST_F(FileSystemTest, CreateDirectoriesMakesParents) {
  auto nested = temp_dir_->path() / "x" / "y" / "z";

  EXPECT_OK(FileSystem::createDirectories(nested));
  EXPECT_TRUE(std::filesystem::is_directory(nested));

  // Already existing is fine
  EXPECT_OK(FileSystem::createDirectories(nested));
}

TEST_F(FileSystemTest, ValidateDirectory) {
  EXPECT_OK(FileSystem::validateDirectory(temp_dir_->path()));
  EXPECT_ERROR(FileSystem::validateDirectory(temp_dir_->path() / "missing"),
               ErrorCode::kDirectoryNotFound);
  EXPECT_ERROR(FileSystem::validateDirectory(temp_dir_->createFile("plain.txt")),
               ErrorCode::kDirectoryNotFound);
}

TEST_F(FileSystemTest, ValidateDirectoryRejectsReadOnlyDirectory) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "Permission bits do not apply to root";
  }

  auto dir = temp_dir_->createSubdir("readonly");
  std::filesystem::permissions(dir, std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec);

  EXPECT_ERROR(FileSystem::validateDirectory(dir), ErrorCode::kFilePermissionDenied);
}

TEST_F(FileSystemTest, WriteFileAtomicReplacesContent) {
  auto target = temp_dir_->path() / "sub" / "config.toml";

  ASSERT_OK(FileSystem::writeFileAtomic(target, "first"));
  EXPECT_EQ(readFile(target), "first");

  ASSERT_OK(FileSystem::writeFileAtomic(target, "second"));
  EXPECT_EQ(readFile(target), "second");

  // No staging files left behind
  size_t count = 0;
  for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(target.parent_path())) {
    ++count;
  }
  EXPECT_EQ(count, 1u);
}
