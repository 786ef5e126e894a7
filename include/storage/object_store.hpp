#ifndef BLOBPIPE_STORAGE_OBJECT_STORE_HPP
#define BLOBPIPE_STORAGE_OBJECT_STORE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/coroutine_context.hpp"
#include "config/store_config.hpp"
#include "storage/storage_error.hpp"

namespace blobpipe::storage {

struct ByteRange {
  std::uint64_t offset;
  std::uint64_t length;
};

struct ObjectInfo {
  std::uint64_t size = 0;
  std::string etag;
  std::string content_type;
};

struct CompletedPart {
  int part_number;
  std::string etag;
};

// Client side of an S3-compatible object store. Blocking operations throw
// StorageError; the async_ variants have the same contract but suspend the
// calling coroutine instead of blocking its thread.
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  // ---- SINGLE-SHOT OPERATIONS ----
  // Stores body under key and returns the ETag
  virtual std::string put_object(const std::string& bucket, const std::string& key,
                                 const std::string& body, const std::string& content_type) = 0;
  // Fetches the object, or the given range of it. Throws ObjectNotFound.
  virtual std::string get_object(const std::string& bucket, const std::string& key,
                                 const std::optional<ByteRange>& range) = 0;
  // Empty when the object does not exist
  virtual std::optional<ObjectInfo> head_object(const std::string& bucket, const std::string& key) = 0;
  // Deleting a missing object succeeds
  virtual void delete_object(const std::string& bucket, const std::string& key) = 0;


  // ---- MULTIPART UPLOAD ----
  // Returns the upload id
  virtual std::string create_multipart_upload(const std::string& bucket, const std::string& key,
                                              const std::string& content_type) = 0;
  // Returns the part's ETag
  virtual std::string upload_part(const std::string& bucket, const std::string& key,
                                  const std::string& upload_id, int part_number,
                                  const std::string& body) = 0;
  virtual void complete_multipart_upload(const std::string& bucket, const std::string& key,
                                         const std::string& upload_id,
                                         const std::vector<CompletedPart>& parts) = 0;
  virtual void abort_multipart_upload(const std::string& bucket, const std::string& key,
                                      const std::string& upload_id) = 0;


  // ---- COOPERATIVE OPERATIONS ----
  // Default implementations run the blocking call and then yield, which suits
  // backends without network I/O
  virtual std::string async_put_object(const std::string& bucket, const std::string& key,
                                       const std::string& body, const std::string& content_type,
                                       CoroutineContext context);
  virtual std::string async_get_object(const std::string& bucket, const std::string& key,
                                       const std::optional<ByteRange>& range,
                                       CoroutineContext context);
  virtual std::optional<ObjectInfo> async_head_object(const std::string& bucket, const std::string& key,
                                                      CoroutineContext context);
  virtual void async_delete_object(const std::string& bucket, const std::string& key,
                                   CoroutineContext context);
  virtual std::string async_create_multipart_upload(const std::string& bucket, const std::string& key,
                                                    const std::string& content_type,
                                                    CoroutineContext context);
  virtual std::string async_upload_part(const std::string& bucket, const std::string& key,
                                        const std::string& upload_id, int part_number,
                                        const std::string& body, CoroutineContext context);
  virtual void async_complete_multipart_upload(const std::string& bucket, const std::string& key,
                                               const std::string& upload_id,
                                               const std::vector<CompletedPart>& parts,
                                               CoroutineContext context);
  virtual void async_abort_multipart_upload(const std::string& bucket, const std::string& key,
                                            const std::string& upload_id, CoroutineContext context);
};

// Builds the backend matching the endpoint scheme: LocalObjectStore for
// file:// endpoints, S3ObjectStore otherwise
std::unique_ptr<ObjectStore> make_object_store(const config::StoreConfig& config);

} // namespace blobpipe::storage

#endif // BLOBPIPE_STORAGE_OBJECT_STORE_HPP
