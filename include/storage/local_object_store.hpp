#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>
#include "storage/object_store.hpp"

namespace blobpipe {
namespace storage {

// Object store kept in a local directory. Each bucket is a subdirectory and
// objects are placed at a path derived from the SHA-256 of their key.
class LocalObjectStore : public ObjectStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit LocalObjectStore(const std::filesystem::path& base_path);


  // ---- SINGLE-SHOT OPERATIONS ----
  std::string put_object(const std::string& bucket, const std::string& key,
                         const std::string& body, const std::string& content_type) override;
  std::string get_object(const std::string& bucket, const std::string& key,
                         const std::optional<ByteRange>& range) override;
  std::optional<ObjectInfo> head_object(const std::string& bucket, const std::string& key) override;
  void delete_object(const std::string& bucket, const std::string& key) override;


  // ---- MULTIPART UPLOAD ----
  std::string create_multipart_upload(const std::string& bucket, const std::string& key,
                                      const std::string& content_type) override;
  std::string upload_part(const std::string& bucket, const std::string& key,
                          const std::string& upload_id, int part_number,
                          const std::string& body) override;
  void complete_multipart_upload(const std::string& bucket, const std::string& key,
                                 const std::string& upload_id,
                                 const std::vector<CompletedPart>& parts) override;
  void abort_multipart_upload(const std::string& bucket, const std::string& key,
                              const std::string& upload_id) override;


  // ---- MAINTENANCE ----
  // Removes every bucket and pending upload
  void clear();
  // Number of multipart uploads that were started but neither completed nor aborted
  std::size_t pending_uploads() const;

private:
  // ---- PARAMETERS ----
  // Root path for all buckets
  std::filesystem::path base_path_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash from key using OpenSSL EVP
  std::string hash_key(const std::string& key) const;
  // {base_path}/{bucket}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& bucket, const std::string& hash) const;
  std::filesystem::path resolve_key_path(const std::string& bucket, const std::string& key) const;
  std::filesystem::path meta_path(const std::filesystem::path& object_path) const;
  std::filesystem::path upload_dir(const std::string& upload_id) const;


  // ---- FILE HELPERS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Writes content to a temporary file and renames it into place
  void write_file(const std::filesystem::path& path, const std::string& content) const;
  std::string read_file(const std::filesystem::path& path, std::uint64_t offset,
                        std::uint64_t length) const;
  void write_meta(const std::filesystem::path& object_path, const std::string& content_type,
                  const std::string& etag) const;
  // Removes empty directories between path and the bucket root
  void prune_empty_dirs(std::filesystem::path current, const std::filesystem::path& stop) const;
  void verify_upload_exists(const std::string& upload_id) const;
};

} // namespace storage
} // namespace blobpipe
