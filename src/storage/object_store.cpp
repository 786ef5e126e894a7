#include "storage/object_store.hpp"
#include "storage/local_object_store.hpp"
#include "storage/s3_object_store.hpp"
#include <boost/log/trivial.hpp>

namespace blobpipe::storage {

//==============================================
// COOPERATIVE OPERATIONS
//==============================================

std::string ObjectStore::async_put_object(const std::string& bucket, const std::string& key,
                                          const std::string& body, const std::string& content_type,
                                          CoroutineContext context) {
  std::string etag = put_object(bucket, key, body, content_type);
  context.yield_now();
  return etag;
}

std::string ObjectStore::async_get_object(const std::string& bucket, const std::string& key,
                                          const std::optional<ByteRange>& range,
                                          CoroutineContext context) {
  std::string body = get_object(bucket, key, range);
  context.yield_now();
  return body;
}

std::optional<ObjectInfo> ObjectStore::async_head_object(const std::string& bucket, const std::string& key,
                                                         CoroutineContext context) {
  auto info = head_object(bucket, key);
  context.yield_now();
  return info;
}

void ObjectStore::async_delete_object(const std::string& bucket, const std::string& key,
                                      CoroutineContext context) {
  delete_object(bucket, key);
  context.yield_now();
}

std::string ObjectStore::async_create_multipart_upload(const std::string& bucket, const std::string& key,
                                                       const std::string& content_type,
                                                       CoroutineContext context) {
  std::string upload_id = create_multipart_upload(bucket, key, content_type);
  context.yield_now();
  return upload_id;
}

std::string ObjectStore::async_upload_part(const std::string& bucket, const std::string& key,
                                           const std::string& upload_id, int part_number,
                                           const std::string& body, CoroutineContext context) {
  std::string etag = upload_part(bucket, key, upload_id, part_number, body);
  context.yield_now();
  return etag;
}

void ObjectStore::async_complete_multipart_upload(const std::string& bucket, const std::string& key,
                                                  const std::string& upload_id,
                                                  const std::vector<CompletedPart>& parts,
                                                  CoroutineContext context) {
  complete_multipart_upload(bucket, key, upload_id, parts);
  context.yield_now();
}

void ObjectStore::async_abort_multipart_upload(const std::string& bucket, const std::string& key,
                                               const std::string& upload_id, CoroutineContext context) {
  abort_multipart_upload(bucket, key, upload_id);
  context.yield_now();
}

//==============================================
// BACKEND SELECTION
//==============================================

std::unique_ptr<ObjectStore> make_object_store(const config::StoreConfig& config) {
  config.validate();
  const config::Endpoint endpoint = config::parse_endpoint(config.endpoint_url);

  if (endpoint.local()) {
    BOOST_LOG_TRIVIAL(info) << "Object store: Using local store at: " << endpoint.base_path;
    return std::make_unique<LocalObjectStore>(endpoint.base_path);
  }

  BOOST_LOG_TRIVIAL(info) << "Object store: Using S3 endpoint: " << config.endpoint_url;
  return std::make_unique<S3ObjectStore>(config);
}

} // namespace blobpipe::storage
