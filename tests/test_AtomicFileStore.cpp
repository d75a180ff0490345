#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "core/Errors.h"
#include "storage/AtomicFileStore.h"

namespace fs = std::filesystem;

class AtomicFileStoreTest : public ::testing::Test {
protected:
  fs::path root;

  void SetUp() override {
    root = fs::temp_directory_path() / "cowork_atomic_store_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root, ec);
  }
};

TEST_F(AtomicFileStoreTest, ReadMissingReturnsNullopt) {
  AtomicFileStore store(root / "state.json");
  EXPECT_FALSE(store.read().has_value());
}

TEST_F(AtomicFileStoreTest, WriteCreatesParentsAndLeavesNoTemp) {
  AtomicFileStore store(root / "nested" / "dir" / "state.json");
  store.write("hello");

  auto content = store.read();
  ASSERT_TRUE(content.has_value());
  EXPECT_EQ(*content, "hello");
  EXPECT_FALSE(fs::exists(store.tempPath()));
  EXPECT_EQ(store.tempPath().filename().u8string(), "state.json.tmp");
}

TEST_F(AtomicFileStoreTest, OverwriteReplacesWholeContent) {
  AtomicFileStore store(root / "state.json");
  store.write(std::string(4096, 'a'));
  store.write("short");
  EXPECT_EQ(store.read().value(), "short");
}

TEST_F(AtomicFileStoreTest, FailedTempWriteKeepsCommittedFile) {
  fs::path target = root / "state.json";
  AtomicFileStore store(target);
  store.write("committed");

  // A directory sitting on the temp path makes the temp write fail.
  fs::create_directories(store.tempPath());
  EXPECT_THROW(store.write("new"), SupervisorError);
  EXPECT_EQ(store.read().value(), "committed");
}

TEST_F(AtomicFileStoreTest, ConcurrentWritersNeverProduceMixedContent) {
  AtomicFileStore store(root / "state.json");
  std::vector<std::thread> writers;
  for (int i = 0; i < 8; ++i) {
    writers.emplace_back([&store, i] {
      std::string body(2048, static_cast<char>('a' + i));
      for (int n = 0; n < 20; ++n) store.write(body);
    });
  }
  for (auto& t : writers) t.join();

  std::string content = store.read().value();
  ASSERT_EQ(content.size(), 2048u);
  EXPECT_EQ(content.find_first_not_of(content[0]), std::string::npos);
}
