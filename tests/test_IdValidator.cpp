#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>

#include "core/Errors.h"
#include "utils/IdValidator.h"

namespace fs = std::filesystem;

static ErrorKind kindOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const SupervisorError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected SupervisorError";
  return ErrorKind::Io;
}

TEST(IdValidator, AcceptsAlphanumericHyphenUnderscore) {
  EXPECT_NO_THROW(IdValidator::validateSafeId("ws_01-abc", "workspace_id"));
  EXPECT_NO_THROW(IdValidator::validateSafeId("A", "thread_id"));
  EXPECT_TRUE(IdValidator::isSafeId("thread-42_X"));
}

TEST(IdValidator, AcceptsExactlyMaxLength) {
  std::string id(IdValidator::kMaxIdLength, 'a');
  EXPECT_NO_THROW(IdValidator::validateSafeId(id, "thread_id"));
}

TEST(IdValidator, RejectsEmptyAndTooLong) {
  EXPECT_EQ(kindOf([] { IdValidator::validateSafeId("", "thread_id"); }), ErrorKind::InvalidInput);
  std::string id(IdValidator::kMaxIdLength + 1, 'a');
  EXPECT_EQ(kindOf([&] { IdValidator::validateSafeId(id, "thread_id"); }), ErrorKind::InvalidInput);
}

TEST(IdValidator, RejectsPathCharacters) {
  for (const char* bad : {"../etc", "a/b", "a\\b", "a.b", "a b", "a\nb", "\xc3\xa9t\xc3\xa9"}) {
    EXPECT_FALSE(IdValidator::isSafeId(bad)) << bad;
    EXPECT_EQ(kindOf([&] { IdValidator::validateSafeId(bad, "thread_id"); }), ErrorKind::InvalidInput) << bad;
  }
}

TEST(IdValidator, ErrorMessageNamesTheField) {
  try {
    IdValidator::validateSafeId("a/b", "workspace_id");
    FAIL() << "expected SupervisorError";
  } catch (const SupervisorError& e) {
    EXPECT_NE(std::string(e.what()).find("workspace_id"), std::string::npos) << e.what();
  }
}

TEST(IdValidator, WorkspacePathMustBeExistingDirectory) {
  fs::path root = fs::temp_directory_path() / "cowork_idvalidator_test";
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root);

  EXPECT_NO_THROW(IdValidator::validateWorkspacePath(root.u8string()));

  EXPECT_EQ(kindOf([&] { IdValidator::validateWorkspacePath((root / "missing").u8string()); }),
            ErrorKind::NotFound);
  EXPECT_EQ(kindOf([] { IdValidator::validateWorkspacePath(""); }), ErrorKind::NotFound);

  fs::path file = root / "plain.txt";
  std::ofstream(file) << "x";
  EXPECT_EQ(kindOf([&] { IdValidator::validateWorkspacePath(file.u8string()); }), ErrorKind::InvalidInput);

  fs::remove_all(root, ec);
}
