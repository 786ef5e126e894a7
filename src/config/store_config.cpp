#include "config/store_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <boost/log/trivial.hpp>

namespace blobpipe {
namespace config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : fallback;
}

std::uint16_t parse_port(const std::string& text, const std::string& url) {
  if (text.empty() || !std::all_of(text.begin(), text.end(),
                                   [](unsigned char c) { return std::isdigit(c); })) {
    throw ConfigError("Invalid port in endpoint: " + url);
  }
  unsigned long port = 0;
  try {
    port = std::stoul(text);
  } catch (const std::exception&) {
    throw ConfigError("Invalid port in endpoint: " + url);
  }
  if (port == 0 || port > 65535) {
    throw ConfigError("Port out of range in endpoint: " + url);
  }
  return static_cast<std::uint16_t>(port);
}

} // namespace

//==============================================
// ENDPOINT PARSING
//==============================================

std::string Endpoint::host_header() const {
  const bool default_port = (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
  return default_port ? host : host + ":" + std::to_string(port);
}

Endpoint parse_endpoint(const std::string& url) {
  const auto separator = url.find("://");
  if (separator == std::string::npos) {
    throw ConfigError("Endpoint must include a scheme: " + url);
  }

  Endpoint endpoint;
  endpoint.scheme = url.substr(0, separator);
  std::transform(endpoint.scheme.begin(), endpoint.scheme.end(), endpoint.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  std::string rest = url.substr(separator + 3);

  if (endpoint.scheme == "file") {
    if (rest.empty()) {
      throw ConfigError("File endpoint needs a directory: " + url);
    }
    endpoint.base_path = rest;
    return endpoint;
  }

  if (endpoint.scheme != "http" && endpoint.scheme != "https") {
    throw ConfigError("Unsupported endpoint scheme: " + endpoint.scheme);
  }

  // Anything after the authority is ignored, buckets are addressed in path style
  const auto slash = rest.find('/');
  if (slash != std::string::npos) {
    rest = rest.substr(0, slash);
  }

  const auto colon = rest.rfind(':');
  if (colon != std::string::npos) {
    endpoint.host = rest.substr(0, colon);
    endpoint.port = parse_port(rest.substr(colon + 1), url);
  } else {
    endpoint.host = rest;
    endpoint.port = endpoint.secure() ? 443 : 80;
  }

  if (endpoint.host.empty()) {
    throw ConfigError("Endpoint has no host: " + url);
  }
  return endpoint;
}

//==============================================
// STORE CONFIGURATION
//==============================================

StoreConfig StoreConfig::from_environment() {
  StoreConfig config;
  config.endpoint_url = env_or("BLOBPIPE_ENDPOINT", "");
  config.region = env_or("BLOBPIPE_REGION", config.region);
  config.access_key_id = env_or("BLOBPIPE_ACCESS_KEY_ID", "");
  config.secret_access_key = env_or("BLOBPIPE_SECRET_ACCESS_KEY", "");

  const std::string timeout = env_or("BLOBPIPE_TIMEOUT_SECONDS", "");
  if (!timeout.empty()) {
    try {
      config.timeout = std::chrono::seconds(std::stol(timeout));
    } catch (const std::exception&) {
      throw ConfigError("Invalid BLOBPIPE_TIMEOUT_SECONDS: " + timeout);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: Loaded store configuration for endpoint: " << config.endpoint_url;
  return config;
}

void StoreConfig::validate() const {
  if (endpoint_url.empty()) {
    throw ConfigError("No endpoint configured (set BLOBPIPE_ENDPOINT)");
  }

  const Endpoint endpoint = parse_endpoint(endpoint_url);
  if (endpoint.local()) {
    return;
  }

  if (access_key_id.empty() || secret_access_key.empty()) {
    throw ConfigError("Remote endpoint requires BLOBPIPE_ACCESS_KEY_ID and BLOBPIPE_SECRET_ACCESS_KEY");
  }
  if (timeout.count() <= 0) {
    throw ConfigError("Timeout must be positive");
  }
}

} // namespace config
} // namespace blobpipe
