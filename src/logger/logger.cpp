#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace webimg::logging {

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  namespace expr = boost::log::expressions;
  namespace sinks = boost::log::sinks;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto formatter = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "]"
        << " [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
        << expr::smessage;

    if (!log_file.empty()) {
      // Create and configure text file sink backend
      auto backend = boost::make_shared<sinks::text_file_backend>();
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::app);
      backend->set_rotation_size(10 * 1024 * 1024);  // 10 MB
      backend->auto_flush(true);

      using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
      auto sink = boost::make_shared<file_sink>(backend);
      sink->set_formatter(formatter);
      boost::log::core::get()->add_sink(sink);
    }

    if (console) {
      auto backend = boost::make_shared<sinks::text_ostream_backend>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);

      using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
      auto sink = boost::make_shared<console_sink>(backend);
      sink->set_formatter(formatter);
      boost::log::core::get()->add_sink(sink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized"
                             << (log_file.empty() ? std::string() : " with file: " + log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

bool parse_severity(const std::string& text, severity_level& level) {
  if (text == "trace")   { level = severity_level::trace;   return true; }
  if (text == "debug")   { level = severity_level::debug;   return true; }
  if (text == "info")    { level = severity_level::info;    return true; }
  if (text == "warning") { level = severity_level::warning; return true; }
  if (text == "error")   { level = severity_level::error;   return true; }
  if (text == "fatal")   { level = severity_level::fatal;   return true; }
  return false;
}

} // namespace webimg::logging
