#include "cli/cli.hpp"
#include "config/store_config.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <boost/log/trivial.hpp>

namespace {

void configure_logging(const blobpipe::cli::CommandLine& command_line) {
  const auto level = command_line.has_flag("--verbose") ? blobpipe::logger::severity_level::debug
                                                        : blobpipe::logger::severity_level::info;
  if (const std::string* log_file = command_line.option("--log-file")) {
    blobpipe::logger::init_logging(*log_file, level, command_line.has_flag("--verbose"));
  } else {
    blobpipe::logger::init_console_logging(command_line.has_flag("--verbose")
                                             ? level
                                             : blobpipe::logger::severity_level::warning);
  }
}

int run_command(const blobpipe::cli::CommandLine& command_line) {
  try {
    configure_logging(command_line);

    std::unique_ptr<blobpipe::storage::ObjectStore> store;
    if (blobpipe::cli::needs_store(command_line.command)) {
      store = blobpipe::storage::make_object_store(blobpipe::config::StoreConfig::from_environment());
    }

    blobpipe::cli::CLI cli(std::move(store), std::cout);
    return cli.run(command_line);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Command " << command_line.command << " failed: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  const auto command_line = blobpipe::cli::parse_command_line(args);

  if (!command_line.valid) {
    std::cerr << "Error: " << command_line.error << '\n';
    blobpipe::cli::print_usage(std::cerr, argv[0]);
    return 2;
  }
  return run_command(command_line);
}
