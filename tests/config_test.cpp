// Unit tests for regstore/config.hpp
// Tests: YAML file loading, command-line parsing and overrides, validation

#include <gtest/gtest.h>

#include <regstore/config.hpp>
#include <regstore/test_utils.hpp>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace regstore {
namespace {

class ConfigTest : public ::testing::Test {
 protected:
  std::string WriteFile(const std::string& content) {
    const std::string path = dir_.Join("regstore.yaml");
    std::ofstream out(path);
    out << content;
    return path;
  }

  // argv must outlive the call; keep the strings here.
  Config Parse(std::vector<std::string> args) {
    args_ = std::move(args);
    argv_.clear();
    for (auto& a : args_) argv_.push_back(a.data());
    return Config::LoadFromArgs(static_cast<int>(argv_.size()), argv_.data());
  }

  testing::TempDir dir_;
  std::vector<std::string> args_;
  std::vector<char*> argv_;
};

TEST_F(ConfigTest, Defaults) {
  Config config;
  EXPECT_EQ(config.store.path, "./regstore.db");
  EXPECT_EQ(config.log_level, "info");
  EXPECT_EQ(config.store.lock_timeout_ms, 2000);
  EXPECT_EQ(config.store.open_timeout_ms, 5000);
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, LoadFromFile) {
  const std::string path = WriteFile(
      "# regstore config\n"
      "log_level: debug\n"
      "\n"
      "store:\n"
      "  path: \"/var/lib/regstore\"\n"
      "  block_cache_bytes: 1048576\n"
      "  bloom_bits_per_key: 12\n"
      "  lock_timeout_ms: 500\n"
      "  open_timeout_ms: 0\n");

  Config config = Config::LoadFromFile(path);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.store.path, "/var/lib/regstore");
  EXPECT_EQ(config.store.block_cache_bytes, 1048576u);
  EXPECT_EQ(config.store.bloom_bits_per_key, 12);
  EXPECT_EQ(config.store.lock_timeout_ms, 500);
  EXPECT_EQ(config.store.open_timeout_ms, 0);
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, TopLevelDbPath) {
  Config config = Config::LoadFromFile(WriteFile("db_path: '/tmp/x'\n"));
  EXPECT_EQ(config.store.path, "/tmp/x");
}

TEST_F(ConfigTest, FileErrors) {
  EXPECT_THROW(Config::LoadFromFile(dir_.Join("absent.yaml")), std::runtime_error);
  EXPECT_THROW(Config::LoadFromFile(WriteFile("store:\n  just words\n")), std::runtime_error);
  EXPECT_THROW(Config::LoadFromFile(WriteFile("store:\n  lock_timeout_ms: soon\n")),
               std::runtime_error);
}

TEST_F(ConfigTest, ArgsCollectCommand) {
  Config config = Parse({"regstore_cli", "--db-path", "/data/db", "count", "service"});
  EXPECT_EQ(config.store.path, "/data/db");
  EXPECT_EQ(config.command, (std::vector<std::string>{"count", "service"}));
}

TEST_F(ConfigTest, ArgsOverrideFile) {
  const std::string path = WriteFile(
      "log_level: error\n"
      "store:\n"
      "  path: /from/file\n"
      "  lock_timeout_ms: 750\n");

  Config config = Parse({"regstore_cli", "--log-level", "warn", "-c", path, "ns-list", "polaris"});
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_EQ(config.store.path, "/from/file");
  EXPECT_EQ(config.store.lock_timeout_ms, 750);
  EXPECT_EQ(config.command.size(), 2u);

  config = Parse({"regstore_cli", "--config", path, "--db-path", "/from/args"});
  EXPECT_EQ(config.store.path, "/from/args");
  EXPECT_EQ(config.log_level, "error");
}

TEST_F(ConfigTest, ArgErrors) {
  EXPECT_THROW(Parse({"regstore_cli", "--db-path"}), std::runtime_error);
  EXPECT_THROW(Parse({"regstore_cli", "--bogus"}), std::runtime_error);
}

TEST_F(ConfigTest, Validate) {
  Config config;
  config.store.path.clear();
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = Config{};
  config.store.lock_timeout_ms = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = Config{};
  config.store.open_timeout_ms = -1;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = Config{};
  config.log_level = "verbose";
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

}  // namespace
}  // namespace regstore
