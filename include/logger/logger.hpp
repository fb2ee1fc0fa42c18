#ifndef ENCSTREAM_LOGGER_HPP
#define ENCSTREAM_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace encstream {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a text file sink at log_file
void init_logging(const std::string& log_file = "encstream.log",
                  severity_level min_level = boost::log::trivial::info);

// Replaces all sinks with a console (stderr) sink
void init_console_logging(severity_level min_level = boost::log::trivial::info);

// Changes the severity filter without touching the sinks
void set_log_level(severity_level min_level);

// "trace", "debug", "info", "warning", "error" or "fatal".
// Throws std::invalid_argument for anything else.
severity_level parse_severity(const std::string& text);

} // namespace logging
} // namespace encstream

#endif // ENCSTREAM_LOGGER_HPP
