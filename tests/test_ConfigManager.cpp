#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "core/ConfigManager.h"

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    unsetenv("COWORK_DATA_DIR");
    unsetenv("COWORK_DESKTOP_USE_SOURCE");
  }
  void TearDown() override {
    unsetenv("COWORK_DATA_DIR");
    unsetenv("COWORK_DESKTOP_USE_SOURCE");
  }
};

TEST_F(ConfigTest, DefaultsWhenSectionsMissing) {
  Config cfg = Config::fromJson(nlohmann::json::object());
  EXPECT_TRUE(cfg.server.command.empty());
  EXPECT_FALSE(cfg.server.useSource);
  EXPECT_EQ(cfg.server.sidecarName, "cowork-server");
  EXPECT_EQ(cfg.server.startupTimeoutMs, 15000);
  EXPECT_EQ(cfg.server.shutdownGraceMs, 3000);
  EXPECT_EQ(cfg.server.shutdownPollMs, 100);
  EXPECT_FALSE(cfg.storage.dataDir.empty());
  EXPECT_EQ(cfg.logging.file, "cowork.log");
}

TEST_F(ConfigTest, ReadsAllSections) {
  nlohmann::json j = {
    {"server", {
      {"command", {"/bin/sh", "-c", "true"}},
      {"use_source", true},
      {"runtime", "node"},
      {"entry", "server.js"},
      {"repo_root", "/opt/cowork"},
      {"sidecar_name", "agent"},
      {"startup_timeout_ms", 500},
      {"shutdown_grace_ms", 250},
      {"shutdown_poll_ms", 25}
    }},
    {"storage", {{"data_dir", "/tmp/cowork-data"}}},
    {"logging", {{"file", ""}, {"debug", true}}}
  };
  Config cfg = Config::fromJson(j);
  ASSERT_EQ(cfg.server.command.size(), 3u);
  EXPECT_EQ(cfg.server.command[0], "/bin/sh");
  EXPECT_TRUE(cfg.server.useSource);
  EXPECT_EQ(cfg.server.runtime, "node");
  EXPECT_EQ(cfg.server.entry, "server.js");
  EXPECT_EQ(cfg.server.repoRoot, "/opt/cowork");
  EXPECT_EQ(cfg.server.sidecarName, "agent");
  EXPECT_EQ(cfg.server.startupTimeoutMs, 500);
  EXPECT_EQ(cfg.server.shutdownGraceMs, 250);
  EXPECT_EQ(cfg.server.shutdownPollMs, 25);
  EXPECT_EQ(cfg.storage.dataDir, "/tmp/cowork-data");
  EXPECT_TRUE(cfg.logging.file.empty());
  EXPECT_TRUE(cfg.logging.debug);
}

TEST_F(ConfigTest, RejectsNonPositiveTimeouts) {
  EXPECT_THROW(Config::fromJson({{"server", {{"startup_timeout_ms", 0}}}}), std::runtime_error);
  EXPECT_THROW(Config::fromJson({{"server", {{"shutdown_poll_ms", -1}}}}), std::runtime_error);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
  setenv("COWORK_DATA_DIR", "/tmp/from-env", 1);
  setenv("COWORK_DESKTOP_USE_SOURCE", "1", 1);
  Config cfg = Config::fromJson({{"storage", {{"data_dir", "/tmp/from-file"}}}});
  EXPECT_EQ(cfg.storage.dataDir, "/tmp/from-env");
  EXPECT_TRUE(cfg.server.useSource);
}

TEST_F(ConfigTest, LoadReportsMissingAndMalformedFiles) {
  fs::path root = fs::temp_directory_path() / "cowork_config_test";
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root);

  EXPECT_THROW(Config::load((root / "missing.json").u8string()), std::runtime_error);

  fs::path bad = root / "bad.json";
  std::ofstream(bad) << "{ not json";
  EXPECT_THROW(Config::load(bad.u8string()), std::runtime_error);

  fs::path good = root / "good.json";
  std::ofstream(good) << R"({"server": {"startup_timeout_ms": 1234}})";
  EXPECT_EQ(Config::load(good.u8string()).server.startupTimeoutMs, 1234);

  fs::remove_all(root, ec);
}
