#ifndef BLOBPIPE_LOGGER_HPP
#define BLOBPIPE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace blobpipe::logger {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a text file sink (rotated every 10 MB, flushed on
// every record) and, when console is set, a stderr sink. Records below
// min_level are dropped.
void init_logging(const std::string& log_file = "blobpipe.log",
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Console-only setup for tools that were not given a log file
void init_console_logging(severity_level min_level = severity_level::warning);

// Changes the minimum severity of an already configured logger
void set_log_level(severity_level min_level);

} // namespace blobpipe::logger

#endif // BLOBPIPE_LOGGER_HPP
