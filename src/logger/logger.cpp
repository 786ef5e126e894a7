#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace blobpipe::logger {

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

namespace {

// "2024-01-01 12:00:00.000000 [info] [Thread 0x...] message"
auto make_formatter() {
  return expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [" << logging::trivial::severity << "]"
    << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "] "
    << expr::smessage;
}

void add_console_sink() {
  logging::add_console_log(std::clog, keywords::format = make_formatter(), keywords::auto_flush = true);
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();

    // Create and configure text file sink backend
    const std::filesystem::path log_path = std::filesystem::absolute(log_file);
    auto backend = boost::make_shared<logging::sinks::text_file_backend>(
      keywords::file_name = log_path.string(),
      keywords::rotation_size = 10 * 1024 * 1024,
      keywords::open_mode = std::ios::out | std::ios::app
    );
    backend->auto_flush(true);

    using text_sink = logging::sinks::synchronous_sink<logging::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(make_formatter());
    logging::core::get()->add_sink(sink);

    if (console) {
      add_console_sink();
    }

    logging::add_common_attributes();
    logging::core::get()->set_filter(logging::trivial::severity >= min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }

  BOOST_LOG_TRIVIAL(debug) << "Logger: Writing to " << log_file;
}

void init_console_logging(severity_level min_level) {
  logging::core::get()->remove_all_sinks();
  add_console_sink();
  logging::add_common_attributes();
  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

void set_log_level(severity_level min_level) {
  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

} // namespace blobpipe::logger
