#include <unistd.h>
#include <fstream>
#include <gtest/gtest.h>
#include <jsbox/paths.h>
#include <jsbox/storage.h>

#include "utils.h"

class FileStoreTest : public ::testing::Test {
 protected:
  fs::path dir;
  void SetUp() override {
    dir = fs::temp_directory_path() / ("jsbox_store_test_" + std::to_string(getpid()));
    fs::remove_all(dir);
  }
  void TearDown() override {
    fs::remove_all(dir);
  }
};

TEST_F(FileStoreTest, SetGetRemove) {
  FileStore store(dir / "nested", TestLogger("storage"));
  EXPECT_FALSE(store.Get("key"));
  ASSERT_TRUE(store.Set("key", "value\nwith newline"));
  ASSERT_TRUE(store.Set("other", ""));
  EXPECT_EQ(store.Get("key"), std::optional<std::string>("value\nwith newline"));
  EXPECT_EQ(store.Get("other"), std::optional<std::string>(""));
  ASSERT_TRUE(store.Set("key", "replaced"));
  EXPECT_EQ(store.Get("key"), std::optional<std::string>("replaced"));
  EXPECT_TRUE(store.Remove("key"));
  EXPECT_FALSE(store.Get("key"));
  EXPECT_TRUE(store.Remove("key"));

  // only the two keys ever written; no temporaries left behind
  size_t files = 0;
  for (auto& i : fs::directory_iterator(dir / "nested")) {
    EXPECT_EQ(i.path().filename(), "other");
    files++;
  }
  EXPECT_EQ(files, 1);
}

TEST_F(FileStoreTest, Persistent) {
  {
    FileStore store(dir, TestLogger("storage"));
    ASSERT_TRUE(store.Set("jsbox_libraries", "[]"));
  }
  FileStore store(dir, TestLogger("storage"));
  EXPECT_EQ(store.Get("jsbox_libraries"), std::optional<std::string>("[]"));
}

TEST_F(FileStoreTest, InvalidKeys) {
  FileStore store(dir, TestLogger("storage"));
  EXPECT_FALSE(store.Set("../escape", "x"));
  EXPECT_FALSE(store.Set("a/b", "x"));
  EXPECT_FALSE(store.Set("..", "x"));
  EXPECT_FALSE(store.Set("", "x"));
  EXPECT_FALSE(store.Get("../escape"));
  EXPECT_FALSE(fs::exists(dir.parent_path() / "escape"));
  EXPECT_TRUE(IsValidStoreKey("jsbox_trusted_origins"));
  EXPECT_TRUE(IsValidStoreKey("a-b.c"));
}

TEST_F(FileStoreTest, UnwritableDirectory) {
  {
    std::ofstream fout(dir);
    fout << "not a directory";
  }
  FileStore store(dir, TestLogger("storage"));
  EXPECT_FALSE(store.Set("key", "value"));
  EXPECT_FALSE(store.Get("key"));
}

TEST(MemoryStoreTest, FailWrites) {
  MemoryStore store;
  ASSERT_TRUE(store.Set("a", "1"));
  EXPECT_EQ(store.write_count, 1);
  store.fail_writes = true;
  EXPECT_FALSE(store.Set("a", "2"));
  EXPECT_FALSE(store.Remove("a"));
  EXPECT_EQ(store.Get("a"), std::optional<std::string>("1"));
  EXPECT_EQ(store.write_count, 1);
}
