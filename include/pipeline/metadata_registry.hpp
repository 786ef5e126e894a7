#ifndef BLOBPIPE_PIPELINE_METADATA_REGISTRY_HPP
#define BLOBPIPE_PIPELINE_METADATA_REGISTRY_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/error.hpp"
#include "digest/digest_result.hpp"
#include "storage/object_location.hpp"

namespace blobpipe::pipeline {

// Descriptive fields registered alongside an uploaded object
struct FileMetadata {
  std::string category;
  std::string entity;
  std::string extension;
  std::string media_type;
  std::optional<std::string> name;
  std::vector<std::string> tags;
  std::map<std::string, std::string> extra;
};

struct FileRecord {
  std::string id;
  storage::ObjectLocation location;
  FileMetadata metadata;
  // Digests as recorded at upload time; sha256 is empty when none was recorded
  digest::DigestResult digest;
};

struct DownloadRecord {
  std::string file_id;
  storage::ObjectLocation location;
  std::string ip_address;
  std::string user_agent;
};

class RecordNotFound : public Error {
public:
  explicit RecordNotFound(const std::string& object_key)
    : Error("No metadata record for " + object_key) {}
};

// Narrow view of the external metadata service
class MetadataRegistry {
public:
  virtual ~MetadataRegistry() = default;

  virtual FileRecord register_file(const digest::DigestResult& digest,
                                   const storage::ObjectLocation& location,
                                   const FileMetadata& metadata) = 0;
  // Throws RecordNotFound when the location has no record
  virtual FileRecord lookup(const storage::ObjectLocation& location) = 0;
  virtual void record_download(const DownloadRecord& record) = 0;
};

} // namespace blobpipe::pipeline

#endif // BLOBPIPE_PIPELINE_METADATA_REGISTRY_HPP
