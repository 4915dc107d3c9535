#ifndef WEBIMG_TEST_UTILS_HPP
#define WEBIMG_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include "utils/bytes.hpp"

// Set logging severity level and configure logging
inline void init_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
  // Remove any existing sinks to prevent duplicates
  boost::log::core::get()->remove_all_sinks();

  boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

  boost::log::add_console_log(
    std::clog,
    boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
    boost::log::keywords::auto_flush = true
  );

  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
  boost::log::add_common_attributes();
}

// Unique scratch directory under the system temp directory
inline std::filesystem::path make_test_dir(const std::string& prefix) {
  auto dir = std::filesystem::temp_directory_path() /
    (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);
  return dir;
}

// Polls pred until it holds or the timeout passes
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

inline webimg::BytesPtr bytes_of(const std::string& text) {
  return webimg::make_bytes(text);
}

inline std::string string_of(const webimg::BytesPtr& data) {
  return data ? std::string(data->begin(), data->end()) : std::string();
}

#endif // WEBIMG_TEST_UTILS_HPP
