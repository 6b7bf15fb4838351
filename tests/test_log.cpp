#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/uuid.hpp"
#include "log/log.h"

using namespace tether;
namespace fs = std::filesystem;

class LogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("tether_test_" + UUID::generate());
    log_path_ = test_dir_ / "log" / "tetherd.log";
  }

  void TearDown() override {
    spdlog::drop("tether");
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("test"));
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  std::string read(const fs::path &path) {
    std::ifstream file(path);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
  }

  fs::path test_dir_;
  fs::path log_path_;
};

TEST_F(LogTest, CreatesDirectoryAndWrites) {
  init_log(log_path_.string(), 3, "debug");
  spdlog::debug("[Session {}] hello", "s1");

  ASSERT_TRUE(fs::exists(log_path_));
  EXPECT_NE(read(log_path_).find("[Session s1] hello"), std::string::npos);
}

TEST_F(LogTest, RotatesOnEachStart) {
  init_log(log_path_.string(), 2, "info");
  spdlog::info("first run");
  init_log(log_path_.string(), 2, "info");
  spdlog::info("second run");
  init_log(log_path_.string(), 2, "info");

  auto first = test_dir_ / "log" / "tetherd.0.log";
  auto second = test_dir_ / "log" / "tetherd.1.log";
  ASSERT_TRUE(fs::exists(first));
  ASSERT_TRUE(fs::exists(second));
  EXPECT_NE(read(first).find("second run"), std::string::npos);
  EXPECT_NE(read(second).find("first run"), std::string::npos);

  // 只保留 max_files 个历史文件
  init_log(log_path_.string(), 2, "info");
  EXPECT_FALSE(fs::exists(test_dir_ / "log" / "tetherd.2.log"));
}

TEST_F(LogTest, UnknownLevelFallsBackToInfo) {
  init_log(log_path_.string(), 1, "chatty");
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::info);

  init_log(log_path_.string(), 1, "off");
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::off);
}
