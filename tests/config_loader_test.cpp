// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for mfg::ConfigLoader.
//
// Validates:
//   - Missing keys keep their defaults
//   - Every key is read, including the nested numbering / ipc sections
//   - Wrong types, malformed JSON, unreadable files and out-of-range values
//     are ValidationError
// =============================================================================

#include "mfg/config/config_loader.hpp"
#include "mfg/errors/errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using nlohmann::json;

TEST(ConfigLoaderTest, EmptyDocumentKeepsDefaults) {
  const auto cfg = mfg::ConfigLoader::fromJson(json::object());

  EXPECT_EQ(cfg.max_allocation_retries, 3);
  EXPECT_TRUE(cfg.allow_expired_issue);
  EXPECT_EQ(cfg.expiry_critical_days, 7);
  EXPECT_EQ(cfg.expiry_warning_days, 30);
  EXPECT_TRUE(cfg.require_active_bom);
  EXPECT_EQ(cfg.order_prefix, "MO");
  EXPECT_EQ(cfg.issue_prefix, "MI");
  EXPECT_EQ(cfg.receipt_prefix, "PR");
  EXPECT_EQ(cfg.ipc_cmd_endpoint, "tcp://127.0.0.1:5555");
  EXPECT_EQ(cfg.ipc_pub_endpoint, "tcp://127.0.0.1:5556");
}

TEST(ConfigLoaderTest, ReadsEveryKey) {
  const auto cfg = mfg::ConfigLoader::fromJson(json::parse(R"({
    "max_allocation_retries": 5,
    "allow_expired_issue": false,
    "expiry_critical_days": 3,
    "expiry_warning_days": 14,
    "require_active_bom": false,
    "numbering": {"order_prefix": "WO", "issue_prefix": "WI",
                  "receipt_prefix": "WR"},
    "ipc": {"cmd_endpoint": "", "pub_endpoint": "ipc:///tmp/mfg-pub"}
  })"));

  EXPECT_EQ(cfg.max_allocation_retries, 5);
  EXPECT_FALSE(cfg.allow_expired_issue);
  EXPECT_EQ(cfg.expiry_critical_days, 3);
  EXPECT_EQ(cfg.expiry_warning_days, 14);
  EXPECT_FALSE(cfg.require_active_bom);
  EXPECT_EQ(cfg.order_prefix, "WO");
  EXPECT_EQ(cfg.issue_prefix, "WI");
  EXPECT_EQ(cfg.receipt_prefix, "WR");
  EXPECT_EQ(cfg.ipc_cmd_endpoint, "");
  EXPECT_EQ(cfg.ipc_pub_endpoint, "ipc:///tmp/mfg-pub");
}

TEST(ConfigLoaderTest, UnknownKeysAreIgnored) {
  EXPECT_NO_THROW(mfg::ConfigLoader::fromJson(
      json::parse(R"({"log_level": "debug", "expiry_warning_days": 40})")));
}

TEST(ConfigLoaderTest, WrongTypesAreValidationErrors) {
  EXPECT_THROW(mfg::ConfigLoader::fromJson(
                   json::parse(R"({"max_allocation_retries": "three"})")),
               mfg::ValidationError);
  EXPECT_THROW(
      mfg::ConfigLoader::fromJson(json::parse(R"({"numbering": "MO"})")),
      mfg::ValidationError);
  EXPECT_THROW(mfg::ConfigLoader::fromJson(json::parse("[1, 2]")),
               mfg::ValidationError);
}

TEST(ConfigLoaderTest, OutOfRangeValuesAreValidationErrors) {
  EXPECT_THROW(mfg::ConfigLoader::fromJson(
                   json::parse(R"({"max_allocation_retries": 0})")),
               mfg::ValidationError);
  EXPECT_THROW(mfg::ConfigLoader::fromJson(
                   json::parse(R"({"expiry_critical_days": -1})")),
               mfg::ValidationError);
  EXPECT_THROW(
      mfg::ConfigLoader::fromJson(json::parse(
          R"({"expiry_critical_days": 40, "expiry_warning_days": 30})")),
      mfg::ValidationError);
  EXPECT_THROW(mfg::ConfigLoader::fromJson(
                   json::parse(R"({"numbering": {"order_prefix": ""}})")),
               mfg::ValidationError);
}

class ConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() /
            ("mfg_config_test_" +
             std::string(::testing::UnitTest::GetInstance()
                             ->current_test_info()
                             ->name()) +
             ".json");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  void write(const std::string& text) {
    std::ofstream out(path_);
    out << text;
  }

  std::filesystem::path path_;
};

TEST_F(ConfigFileTest, LoadsFromFile) {
  write(R"({"expiry_warning_days": 45, "ipc": {"cmd_endpoint": ""}})");

  const auto cfg = mfg::ConfigLoader::load(path_.string());

  EXPECT_EQ(cfg.expiry_warning_days, 45);
  EXPECT_TRUE(cfg.ipc_cmd_endpoint.empty());
}

TEST_F(ConfigFileTest, MalformedFileIsValidationError) {
  write(R"({"expiry_warning_days": )");
  EXPECT_THROW(mfg::ConfigLoader::load(path_.string()), mfg::ValidationError);
}

TEST_F(ConfigFileTest, MissingFileIsValidationError) {
  EXPECT_THROW(mfg::ConfigLoader::load(path_.string() + ".absent"),
               mfg::ValidationError);
}
