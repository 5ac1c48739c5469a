#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include "tempctx/core/temp_entry.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace tempctx::core;
using namespace tempctx::test;
using tempctx::ErrorCode;

class TempEntryTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<TempDirectory>();
    hook_ = std::make_shared<RecordingHook>();
    registry_ = std::make_unique<TerminationRegistry>(hook_);
  }

  void TearDown() override {
    registry_.reset();
    hook_.reset();
    temp_dir_.reset();
  }

  // Entry for an existing path, registered the way a context would
  std::unique_ptr<TempEntry> adopt(const std::filesystem::path& path, bool is_directory) {
    registry_->registerEntry(kContext, path.filename().string(), path, is_directory);
    return std::make_unique<TempEntry>(*registry_, kContext, path, is_directory);
  }

  static constexpr ContextId kContext = 5;

  std::unique_ptr<TempDirectory> temp_dir_;
  std::shared_ptr<RecordingHook> hook_;
  std::unique_ptr<TerminationRegistry> registry_;
};

TEST_F(TempEntryTest, PathAvailableWhileOpen) {
  auto file = temp_dir_->createFile("open.tmp");
  auto entry = adopt(file, false);

  auto path = entry->path();
  ASSERT_OK(path);
  EXPECT_EQ(*path, file);
  EXPECT_FALSE(entry->isClosed());
  EXPECT_FALSE(entry->isDirectory());
  EXPECT_EQ(entry->contextId(), kContext);
}

TEST_F(TempEntryTest, CloseDeletesFileAndUnregisters) {
  auto file = temp_dir_->createFile("close.tmp", "content");
  auto entry = adopt(file, false);
  ASSERT_EQ(registry_->size(kContext), 1u);

  EXPECT_OK(entry->close());

  EXPECT_FALSE(std::filesystem::exists(file));
  EXPECT_EQ(registry_->size(kContext), 0u);
  EXPECT_TRUE(entry->isClosed());
}

TEST_F(TempEntryTest, CloseDeletesDirectoryRecursively) {
  auto dir = temp_dir_->createSubdir("tree");
  temp_dir_->createFile("tree/a.txt", "a");
  std::filesystem::create_directories(dir / "sub" / "deeper");
  temp_dir_->createFile("tree/sub/deeper/b.txt", "b");
  std::filesystem::create_symlink(temp_dir_->path(), dir / "link_outside");

  auto entry = adopt(dir, true);
  EXPECT_OK(entry->close());

  EXPECT_FALSE(std::filesystem::exists(dir));
  // Symlink removed, never followed
  EXPECT_TRUE(std::filesystem::exists(temp_dir_->path()));
}

TEST_F(TempEntryTest, PathAfterCloseIsAStateError) {
  auto entry = adopt(temp_dir_->createFile("state.tmp"), false);
  ASSERT_OK(entry->close());

  EXPECT_ERROR(entry->path(), ErrorCode::kInvalidState);
}

TEST_F(TempEntryTest, CloseIsIdempotent) {
  auto entry = adopt(temp_dir_->createFile("twice.tmp"), false);

  EXPECT_OK(entry->close());
  EXPECT_OK(entry->close());
}

TEST_F(TempEntryTest, CloseSucceedsWhenPathAlreadyGone) {
  auto file = temp_dir_->createFile("vanished.tmp");
  auto entry = adopt(file, false);
  std::filesystem::remove(file);

  EXPECT_OK(entry->close());
}

TEST_F(TempEntryTest, FailedDeletionReportsPathAndCause) {
  // Registered as a file, so removing the non-empty directory fails
  auto dir = temp_dir_->createSubdir("not_a_file");
  temp_dir_->createFile("not_a_file/keep.txt");
  auto entry = adopt(dir, false);

  auto result = entry->close();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kFileDeleteError);
  EXPECT_EQ(result.error().path(), dir);
  EXPECT_EQ(result.error().causes().size(), 1u);

  // Not retried: the entry is closed and no longer tracked
  EXPECT_TRUE(entry->isClosed());
  EXPECT_EQ(registry_->size(kContext), 0u);
  EXPECT_OK(entry->close());
}

TEST_F(TempEntryTest, ConcurrentCloseHasExactlyOneWinner) {
  auto file = temp_dir_->createFile("race.tmp");
  auto entry = adopt(file, false);

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      if (!entry->close().has_value()) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_FALSE(std::filesystem::exists(file));
  EXPECT_TRUE(entry->isClosed());
}

TEST_F(TempEntryTest, DestructorClosesOpenEntry) {
  auto file = temp_dir_->createFile("scoped.tmp");
  {
    auto entry = adopt(file, false);
    EXPECT_TRUE(std::filesystem::exists(file));
  }

  EXPECT_FALSE(std::filesystem::exists(file));
  EXPECT_EQ(registry_->size(kContext), 0u);
}
