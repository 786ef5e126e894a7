#include "cli/cli.hpp"
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <thread>
#include <boost/log/trivial.hpp>
#include "common/error.hpp"
#include "config/store_config.hpp"
#include "digest/digest_engine.hpp"
#include "integrity/integrity_verifier.hpp"
#include "pipeline/sidecars.hpp"
#include "storage/object_location.hpp"
#include "transfer/cooperative_transfer_client.hpp"
#include "transfer/threaded_transfer_client.hpp"

namespace blobpipe {
namespace cli {

namespace {

const std::set<std::string> VALUE_OPTIONS = {
  "--content-type", "--threshold", "--chunk", "--concurrency", "--verify", "--log-file"
};

const std::set<std::string> FLAG_OPTIONS = {
  "--sidecars", "--cooperative", "--verify-sidecar", "--verbose"
};

std::uint64_t parse_size(const std::string& name, const std::string& value) {
  // stoull accepts a sign and whitespace and wraps negative input
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
    throw config::ConfigError("Invalid value for " + name + ": " + value);
  }
  try {
    std::size_t consumed = 0;
    const unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception&) {
    throw config::ConfigError("Invalid value for " + name + ": " + value);
  }
}

void expect_arguments(const CommandLine& command_line, std::size_t count, const std::string& usage) {
  if (command_line.arguments.size() != count) {
    throw config::ConfigError("Usage: blobpipe " + usage);
  }
}

} // namespace

//==============================================
// ARGUMENT PARSING
//==============================================

const std::string* CommandLine::option(const std::string& name) const {
  const auto it = options.find(name);
  return it == options.end() ? nullptr : &it->second;
}

CommandLine parse_command_line(const std::vector<std::string>& args) {
  CommandLine command_line;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (VALUE_OPTIONS.count(arg) > 0) {
      if (i + 1 >= args.size()) {
        command_line.error = "Missing value for " + arg;
        return command_line;
      }
      command_line.options[arg] = args[++i];
    } else if (FLAG_OPTIONS.count(arg) > 0) {
      command_line.flags.insert(arg);
    } else if (arg.rfind("--", 0) == 0) {
      command_line.error = "Unknown argument: " + arg;
      return command_line;
    } else if (command_line.command.empty()) {
      command_line.command = arg;
    } else {
      command_line.arguments.push_back(arg);
    }
  }

  if (command_line.command.empty()) {
    command_line.error = "No command given";
    return command_line;
  }
  if (command_line.option("--verify") && command_line.has_flag("--verify-sidecar")) {
    command_line.error = "--verify and --verify-sidecar are mutually exclusive";
    return command_line;
  }

  command_line.valid = true;
  return command_line;
}

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [--log-file <file>] [--verbose] <command> [options]\n"
      << "Commands:\n"
      << "  digest <file>                        Print size and md5/sha1/sha256/sha512\n"
      << "  put <file> <bucket> <path/version/filename>\n"
      << "      [--sidecars] [--content-type <type>] [--threshold <bytes>]\n"
      << "      [--chunk <bytes>] [--concurrency <n>] [--cooperative]\n"
      << "  get <bucket> <path/version/filename> <destination>\n"
      << "      [--verify <sha256> | --verify-sidecar] [transfer options]\n"
      << "  exists <bucket> <path/version/filename>\n"
      << "  rm <bucket> <path/version/filename> [--sidecars]\n"
      << "The object store is taken from BLOBPIPE_ENDPOINT, BLOBPIPE_REGION,\n"
      << "BLOBPIPE_ACCESS_KEY_ID, BLOBPIPE_SECRET_ACCESS_KEY and BLOBPIPE_TIMEOUT_SECONDS.\n"
      << "Example: " << program_name << " put build.zip releases /myapp/v1/build.zip --sidecars\n";
}

bool needs_store(const std::string& command) {
  return command == "put" || command == "get" || command == "exists" || command == "rm";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(std::unique_ptr<storage::ObjectStore> store, std::ostream& out)
  : store_(std::move(store))
  , out_(out) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}

//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::run(const CommandLine& command_line) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command_line.command << " with "
                           << command_line.arguments.size() << " arguments";

  if (command_line.command == "digest") {
    return handle_digest_command(command_line);
  }
  if (command_line.command == "put") {
    return handle_put_command(command_line);
  }
  if (command_line.command == "get") {
    return handle_get_command(command_line);
  }
  if (command_line.command == "exists") {
    return handle_exists_command(command_line);
  }
  if (command_line.command == "rm") {
    return handle_rm_command(command_line);
  }
  throw config::ConfigError("Unknown command: " + command_line.command);
}

int CLI::handle_digest_command(const CommandLine& command_line) {
  expect_arguments(command_line, 1, "digest <file>");

  const digest::DigestResult result = digest::DigestEngine().compute(command_line.arguments[0]);
  out_ << std::left << std::setw(8) << "size" << result.size << "\n";
  for (const digest::Algorithm algorithm : digest::ALL_ALGORITHMS) {
    out_ << std::left << std::setw(8) << digest::to_string(algorithm) << result.hex(algorithm) << "\n";
  }
  return 0;
}

int CLI::handle_put_command(const CommandLine& command_line) {
  expect_arguments(command_line, 3, "put <file> <bucket> <path/version/filename>");

  const std::filesystem::path source = command_line.arguments[0];
  const auto location = storage::ObjectLocation::parse(command_line.arguments[1], command_line.arguments[2]);
  auto client = make_client(command_line);

  transfer::UploadOptions options;
  options.config = make_config(command_line);
  options.observer = make_progress_printer();
  if (const std::string* content_type = command_line.option("--content-type")) {
    options.content_type = *content_type;
  }

  // Digest the source before it leaves so the sidecars describe what was read
  std::optional<digest::DigestResult> digests;
  if (command_line.has_flag("--sidecars")) {
    digests = digest::DigestEngine().compute(source);
  }

  const std::string key = client->upload(source, location, options);
  out_ << "\n";

  if (digests) {
    pipeline::upload_sidecars(*client, location, *digests);
  }

  out_ << "Uploaded " << location.bucket << "/" << key << std::endl;
  return 0;
}

int CLI::handle_get_command(const CommandLine& command_line) {
  expect_arguments(command_line, 3, "get <bucket> <path/version/filename> <destination>");

  const auto location = storage::ObjectLocation::parse(command_line.arguments[0], command_line.arguments[1]);
  const std::filesystem::path destination = command_line.arguments[2];
  auto client = make_client(command_line);

  transfer::DownloadOptions options;
  options.config = make_config(command_line);
  options.observer = make_progress_printer();

  client->download(location, destination, options);
  out_ << "\n";

  std::string expected;
  if (const std::string* verify = command_line.option("--verify")) {
    expected = *verify;
  } else if (command_line.has_flag("--verify-sidecar")) {
    expected = expected_from_sidecar(location);
  }
  if (!expected.empty()) {
    integrity::IntegrityVerifier().verify(destination, expected, digest::Algorithm::Sha256);
    out_ << "Verified sha256 " << expected << std::endl;
  }

  out_ << "Downloaded " << location.bucket << "/" << location.object_key() << " to " << destination.string()
       << std::endl;
  return 0;
}

int CLI::handle_exists_command(const CommandLine& command_line) {
  expect_arguments(command_line, 2, "exists <bucket> <path/version/filename>");

  const auto location = storage::ObjectLocation::parse(command_line.arguments[0], command_line.arguments[1]);
  const bool found = make_client(command_line)->exists(location.bucket, location.object_key());
  out_ << (found ? "present" : "absent") << std::endl;
  return found ? 0 : 1;
}

int CLI::handle_rm_command(const CommandLine& command_line) {
  expect_arguments(command_line, 2, "rm <bucket> <path/version/filename>");

  const auto location = storage::ObjectLocation::parse(command_line.arguments[0], command_line.arguments[1]);
  auto client = make_client(command_line);
  pipeline::remove_object(*client, location, command_line.has_flag("--sidecars"));
  out_ << "Removed " << location.bucket << "/" << location.object_key() << std::endl;
  return 0;
}

//==============================================
// HELPERS
//==============================================

storage::ObjectStore& CLI::store() {
  if (!store_) {
    throw config::ConfigError("No object store configured");
  }
  return *store_;
}

std::unique_ptr<transfer::TransferClient> CLI::make_client(const CommandLine& command_line) {
  const transfer::TransferConfig config = make_config(command_line);
  if (command_line.has_flag("--cooperative")) {
    return std::make_unique<transfer::CooperativeTransferClient>(store(), config);
  }
  return std::make_unique<transfer::ThreadedTransferClient>(store(), config);
}

transfer::TransferConfig CLI::make_config(const CommandLine& command_line) const {
  transfer::TransferConfig config = transfer::make_default_config(std::thread::hardware_concurrency());
  if (const std::string* threshold = command_line.option("--threshold")) {
    config.multipart_threshold = parse_size("--threshold", *threshold);
  }
  if (const std::string* chunk = command_line.option("--chunk")) {
    config.chunk_size = parse_size("--chunk", *chunk);
    if (config.chunk_size == 0) {
      throw config::ConfigError("--chunk must be greater than zero");
    }
  }
  if (const std::string* concurrency = command_line.option("--concurrency")) {
    const std::uint64_t parsed = parse_size("--concurrency", *concurrency);
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
      throw config::ConfigError("--concurrency is out of range: " + *concurrency);
    }
    config.max_concurrency = static_cast<std::uint32_t>(parsed);
    config.use_parallelism = config.max_concurrency > 1;
  }
  return config;
}

transfer::ProgressObserver CLI::make_progress_printer() {
  return [this](std::uint64_t bytes) {
    out_ << "\r" << bytes << " bytes" << std::flush;
  };
}

std::string CLI::expected_from_sidecar(const storage::ObjectLocation& location) {
  const std::string key = storage::sidecar_key(location.object_key(), digest::Algorithm::Sha256);

  // Read in memory; nothing is written beside the destination
  std::string content;
  try {
    content = store().get_object(location.bucket, key, std::nullopt);
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: Failed to read checksum file " << key << ": " << e.what();
    throw DownloadFailure(key, e.what());
  }

  const std::string expected = pipeline::parse_sidecar(content);
  if (expected.empty()) {
    throw IoError("Malformed checksum file for " + location.object_key());
  }
  return expected;
}

} // namespace cli
} // namespace blobpipe
