#pragma once

#include <iosfwd>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "storage/object_location.hpp"
#include "storage/object_store.hpp"
#include "transfer/transfer_client.hpp"

namespace blobpipe {
namespace cli {

struct CommandLine {
  std::string command;
  std::vector<std::string> arguments;
  // --name value
  std::map<std::string, std::string> options;
  // --name
  std::set<std::string> flags;
  bool valid{false};
  std::string error;

  bool has_flag(const std::string& name) const { return flags.count(name) > 0; }
  const std::string* option(const std::string& name) const;
};

// Splits argv (without the program name) into command, positional arguments,
// valued options and flags
CommandLine parse_command_line(const std::vector<std::string>& args);

void print_usage(std::ostream& out, const std::string& program_name);

// True for commands that talk to the object store
bool needs_store(const std::string& command);

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // store may be empty for commands that never reach the object store
  CLI(std::unique_ptr<storage::ObjectStore> store, std::ostream& out);


  // ---- COMMAND PROCESSING ----
  // Returns the process exit code. Errors propagate to the caller.
  int run(const CommandLine& command_line);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<storage::ObjectStore> store_;
  std::ostream& out_;


  // ---- COMMAND HANDLERS ----
  int handle_digest_command(const CommandLine& command_line);
  int handle_put_command(const CommandLine& command_line);
  int handle_get_command(const CommandLine& command_line);
  int handle_exists_command(const CommandLine& command_line);
  int handle_rm_command(const CommandLine& command_line);


  // ---- HELPERS ----
  storage::ObjectStore& store();
  std::unique_ptr<transfer::TransferClient> make_client(const CommandLine& command_line);
  transfer::TransferConfig make_config(const CommandLine& command_line) const;
  transfer::ProgressObserver make_progress_printer();
  std::string expected_from_sidecar(const storage::ObjectLocation& location);
};

} // namespace cli
} // namespace blobpipe
