#ifndef BLOBPIPE_CONFIG_STORE_CONFIG_HPP
#define BLOBPIPE_CONFIG_STORE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace blobpipe {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Decomposed endpoint URL
struct Endpoint {
  std::string scheme;       // "http", "https" or "file"
  std::string host;
  std::uint16_t port = 0;
  std::string base_path;    // directory for file:// endpoints, otherwise empty

  bool secure() const { return scheme == "https"; }
  bool local() const { return scheme == "file"; }
  // Value for the Host header, port omitted when it is the scheme default
  std::string host_header() const;
};

// Parses http://host[:port], https://host[:port] or file:///dir
Endpoint parse_endpoint(const std::string& url);


struct StoreConfig {
  std::string endpoint_url;
  std::string region = "auto";
  std::string access_key_id;
  std::string secret_access_key;
  // Applied to every HTTP exchange of a transfer
  std::chrono::seconds timeout{30};

  // Reads BLOBPIPE_ENDPOINT, BLOBPIPE_REGION, BLOBPIPE_ACCESS_KEY_ID,
  // BLOBPIPE_SECRET_ACCESS_KEY and BLOBPIPE_TIMEOUT_SECONDS
  static StoreConfig from_environment();

  // Throws ConfigError when the endpoint is malformed or credentials are
  // missing for a remote endpoint
  void validate() const;
};

} // namespace config
} // namespace blobpipe

#endif // BLOBPIPE_CONFIG_STORE_CONFIG_HPP
