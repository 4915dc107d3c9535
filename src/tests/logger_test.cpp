#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace webimg::logging;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path log_path;

  void SetUp() override {
    test_dir = make_test_dir("logger_test");
    log_path = test_dir / "webimg-test.log";
    webimg::logging::init_logging(log_path.string(), severity_level::trace, false);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    // Back to the console sink the rest of the suite uses
    ::init_logging();
    std::filesystem::remove_all(test_dir);
  }

  std::string log_contents() {
    boost::log::core::get()->flush();
    std::ifstream file(log_path, std::ios::in | std::ios::binary);
    std::stringstream content;
    content << file.rdbuf();
    return content.str();
  }

  bool log_contains(const std::string& text) {
    return log_contents().find(text) != std::string::npos;
  }
};

TEST_F(LoggerTest, BasicLogging) {
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
  webimg::logging::init_logging(log_path.string(), severity_level::info, false);
  BOOST_LOG_TRIVIAL(info) << "Second run";

  EXPECT_TRUE(log_contains("First run"));
  EXPECT_TRUE(log_contains("Second run"));
}

TEST(LoggerParseTest, ParsesSeverityNames) {
  severity_level level = severity_level::info;
  EXPECT_TRUE(parse_severity("trace", level));
  EXPECT_EQ(level, severity_level::trace);
  EXPECT_TRUE(parse_severity("warning", level));
  EXPECT_EQ(level, severity_level::warning);
  EXPECT_TRUE(parse_severity("fatal", level));
  EXPECT_EQ(level, severity_level::fatal);

  EXPECT_FALSE(parse_severity("verbose", level));
  EXPECT_FALSE(parse_severity("INFO", level));
  EXPECT_EQ(level, severity_level::fatal);
}
