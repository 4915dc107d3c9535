#ifndef WEBIMG_LOGGER_HPP
#define WEBIMG_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace webimg::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a synchronous text file sink (and optionally a console sink) with
// timestamp and severity formatting. Replaces any sinks installed before.
void init_logging(const std::string& log_file = "webimg.log",
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Changes the global severity filter
void set_log_level(severity_level min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_severity(const std::string& text, severity_level& level);

} // namespace webimg::logging

#endif // WEBIMG_LOGGER_HPP
