#include "storage/object_location.hpp"
#include <sstream>
#include <vector>

namespace blobpipe::storage {

namespace {

std::string strip_slashes(const std::string& value) {
  const auto first = value.find_first_not_of('/');
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of('/');
  return value.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& value, char delimiter) {
  std::vector<std::string> parts;
  std::stringstream ss(value);
  std::string part;
  while (std::getline(ss, part, delimiter)) {
    parts.push_back(part);
  }
  return parts;
}

} // namespace

std::string ObjectLocation::object_key() const {
  const std::string trimmed = strip_slashes(path);
  if (trimmed.empty()) {
    return "/" + version + "/" + filename;
  }
  return trimmed + "/" + version + "/" + filename;
}

ObjectLocation ObjectLocation::parse(const std::string& bucket, const std::string& object_id) {
  const std::string trimmed = strip_slashes(object_id);
  const std::vector<std::string> parts = trimmed.empty()
    ? std::vector<std::string>{}
    : split(trimmed, '/');

  if (parts.size() < 3) {
    throw InvalidLocation("object id must have at least 3 components (path/version/filename), got: "
                          + object_id);
  }

  ObjectLocation location;
  location.bucket = bucket;
  location.filename = parts[parts.size() - 1];
  location.version = parts[parts.size() - 2];

  std::string path;
  for (std::size_t i = 0; i + 2 < parts.size(); ++i) {
    path += "/" + parts[i];
  }
  location.path = path;
  return location;
}

std::string sidecar_key(const std::string& object_key, digest::Algorithm algorithm) {
  return object_key + "." + digest::to_string(algorithm);
}

std::string sidecar_content(const std::string& hex_digest, const std::string& filename) {
  return hex_digest + "  " + filename + "\n";
}

} // namespace blobpipe::storage
