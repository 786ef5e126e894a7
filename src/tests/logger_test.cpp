#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace blobpipe::logger;

class LoggerTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> dir;
  std::filesystem::path log_file;

  void SetUp() override {
    dir = std::make_unique<TempDir>("logger_test");
    log_file = *dir / "blobpipe.log";
    blobpipe::logger::init_logging(log_file.string(), severity_level::trace);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    dir.reset();
    // Leave the default test sink in place for later suites
    ::init_logging();
  }

  bool log_contains(const std::string& text) {
    boost::log::core::get()->flush();
    std::ifstream file(log_file, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
      return false;
    }
    std::stringstream content;
    content << file.rdbuf();
    return content.str().find(text) != std::string::npos;
  }
};

TEST_F(LoggerTest, WritesToLogFile) {
  BOOST_LOG_TRIVIAL(info) << "Test info message";
  BOOST_LOG_TRIVIAL(error) << "Test error message";

  EXPECT_TRUE(log_contains("Test info message"));
  EXPECT_TRUE(log_contains("Test error message"));
  EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, ThreadLogging) {
  std::thread t([]() {
    BOOST_LOG_TRIVIAL(info) << "Message from thread";
  });
  t.join();

  EXPECT_TRUE(log_contains("Message from thread"));
  EXPECT_TRUE(log_contains("[Thread "));
}

TEST_F(LoggerTest, LogLevelFiltering) {
  set_log_level(severity_level::warning);

  BOOST_LOG_TRIVIAL(debug) << "Should not appear";
  BOOST_LOG_TRIVIAL(warning) << "Should appear";

  EXPECT_FALSE(log_contains("Should not appear"));
  EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, ReinitializingAppends) {
  BOOST_LOG_TRIVIAL(info) << "First run";
  boost::log::core::get()->flush();

  blobpipe::logger::init_logging(log_file.string(), severity_level::info);
  BOOST_LOG_TRIVIAL(info) << "Second run";

  EXPECT_TRUE(log_contains("First run"));
  EXPECT_TRUE(log_contains("Second run"));
}
