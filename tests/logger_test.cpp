#include "utils/logger.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("mediagrab_logger_" + std::to_string(::getpid()));
  }

  void TearDown() override {
    // 恢复成只输出到控制台，避免影响其他测试
    utils::LogConfig config;
    config.logFilePath = "";
    utils::Logger::initialize(config);
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string logContent() const {
    std::ifstream in(dir_ / "mediagrab.log");
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  }

  fs::path dir_;
};

}  // namespace

TEST_F(LoggerTest, ParsesLevelNames) {
  EXPECT_EQ(utils::ParseLogLevel("DEBUG"), utils::LogLevel::DEBUG);
  EXPECT_EQ(utils::ParseLogLevel("warning"), utils::LogLevel::WARN);
  EXPECT_EQ(utils::ParseLogLevel("error"), utils::LogLevel::ERROR);
  EXPECT_EQ(utils::ParseLogLevel("verbose"), utils::LogLevel::INFO);
}

TEST_F(LoggerTest, WritesRecordsAtOrAboveMinimumLevel) {
  utils::LogConfig config;
  config.logFilePath = dir_.string();
  config.minLevel = utils::LogLevel::WARN;
  config.toConsole = false;
  utils::Logger::initialize(config);

  LOG(INFO) << "quiet record";
  LOG(WARN) << "job " << 42 << " stalled";
  EXPECT_FALSE(utils::Logger::enabled(utils::LogLevel::DEBUG));

  std::string content = logContent();
  EXPECT_EQ(content.find("quiet record"), std::string::npos);
  EXPECT_NE(content.find("[WARN]"), std::string::npos);
  EXPECT_NE(content.find("job 42 stalled"), std::string::npos);
  EXPECT_NE(content.find("logger_test.cpp"), std::string::npos);
}

TEST_F(LoggerTest, RotatesWhenFileIsFull) {
  utils::LogConfig config;
  config.logFilePath = dir_.string();
  config.maxFileSize = 256;
  config.maxBackupFiles = 2;
  config.toConsole = false;
  utils::Logger::initialize(config);

  for (int i = 0; i < 20; ++i) LOG(INFO) << "line " << i << std::string(40, '.');
  EXPECT_TRUE(fs::exists(dir_ / "mediagrab.log.1"));
  EXPECT_FALSE(fs::exists(dir_ / "mediagrab.log.4"));
}
