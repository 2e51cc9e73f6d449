#ifndef GRIDSYNC_LOGGER_HPP
#define GRIDSYNC_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace gridsync::logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces existing sinks with a text file sink at log_file
void init_logging(const std::string& log_file = "gridsync.log",
                  severity_level min_level = boost::log::trivial::info);

// Replaces existing sinks with a console sink on std::clog
void init_console_logging(severity_level min_level = boost::log::trivial::info);

// ---- RUNTIME CONTROL ----
void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// Accepts trace, debug, info, warning (or warn), error, fatal in any case.
// Throws ConfigError for anything else.
severity_level parse_severity(const std::string& name);

} // namespace gridsync::logging

#endif // GRIDSYNC_LOGGER_HPP
