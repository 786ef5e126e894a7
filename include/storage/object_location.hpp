#ifndef BLOBPIPE_STORAGE_OBJECT_LOCATION_HPP
#define BLOBPIPE_STORAGE_OBJECT_LOCATION_HPP

#include <string>
#include "common/error.hpp"
#include "digest/digest_result.hpp"

namespace blobpipe::storage {

// Identifies an object in the remote store
struct ObjectLocation {
  std::string bucket;
  std::string path;
  std::string filename;
  std::string version;

  // "<path without surrounding slashes>/<version>/<filename>". An empty path
  // keeps the leading separator: "/<version>/<filename>".
  std::string object_key() const;

  // Splits "/path/to/object/<version>/<filename>" into its parts. Throws
  // InvalidLocation when fewer than three components are present.
  static ObjectLocation parse(const std::string& bucket, const std::string& object_id);

  bool operator==(const ObjectLocation& other) const {
    return bucket == other.bucket && path == other.path
        && filename == other.filename && version == other.version;
  }
};

// Key of the checksum sidecar stored next to a primary object
std::string sidecar_key(const std::string& object_key, digest::Algorithm algorithm);

// Sidecar body: "<hex-digest>  <filename>\n"
std::string sidecar_content(const std::string& hex_digest, const std::string& filename);

} // namespace blobpipe::storage

#endif // BLOBPIPE_STORAGE_OBJECT_LOCATION_HPP
