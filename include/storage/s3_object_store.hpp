#ifndef BLOBPIPE_STORAGE_S3_OBJECT_STORE_HPP
#define BLOBPIPE_STORAGE_S3_OBJECT_STORE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>
#include "config/store_config.hpp"
#include "storage/object_store.hpp"
#include "storage/sigv4_signer.hpp"

namespace blobpipe::storage {

// ObjectStore speaking the S3 REST protocol with path-style addressing
// ({endpoint}/{bucket}/{key}). Each request uses its own connection. Blocking
// operations drive the coroutine implementation on a private io_context.
class S3ObjectStore : public ObjectStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit S3ObjectStore(const config::StoreConfig& config);


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


  // ---- COOPERATIVE OPERATIONS ----
  std::string async_put_object(const std::string& bucket, const std::string& key,
                               const std::string& body, const std::string& content_type,
                               CoroutineContext context) override;
  std::string async_get_object(const std::string& bucket, const std::string& key,
                               const std::optional<ByteRange>& range,
                               CoroutineContext context) override;
  std::optional<ObjectInfo> async_head_object(const std::string& bucket, const std::string& key,
                                              CoroutineContext context) override;
  void async_delete_object(const std::string& bucket, const std::string& key,
                           CoroutineContext context) override;
  std::string async_create_multipart_upload(const std::string& bucket, const std::string& key,
                                            const std::string& content_type,
                                            CoroutineContext context) override;
  std::string async_upload_part(const std::string& bucket, const std::string& key,
                                const std::string& upload_id, int part_number,
                                const std::string& body, CoroutineContext context) override;
  void async_complete_multipart_upload(const std::string& bucket, const std::string& key,
                                       const std::string& upload_id,
                                       const std::vector<CompletedPart>& parts,
                                       CoroutineContext context) override;
  void async_abort_multipart_upload(const std::string& bucket, const std::string& key,
                                    const std::string& upload_id, CoroutineContext context) override;

private:
  struct Request {
    boost::beast::http::verb method;
    std::string bucket;
    std::string key;
    std::vector<std::pair<std::string, std::string>> query;
    std::string body;
    std::string content_type;
    std::optional<ByteRange> range;
  };

  struct Response {
    unsigned int status = 0;
    std::string body;
    std::string etag;
    std::string content_type;
    std::uint64_t content_length = 0;
  };

  // ---- PARAMETERS ----
  config::Endpoint endpoint_;
  std::chrono::seconds timeout_;
  SigV4Signer signer_;
  boost::asio::ssl::context ssl_context_;


  // ---- HTTP EXCHANGE ----
  // Signs and sends the request, returning whatever status the server answered with.
  // Throws StorageError on transport failures.
  Response perform(const Request& request, CoroutineContext context);
  template <typename Stream>
  Response exchange(Stream& stream, const Request& request, CoroutineContext context);
  std::string target_for(const Request& request) const;

  // Throws StorageError built from the S3 error document in the response body
  [[noreturn]] void fail(const std::string& operation, const std::string& key,
                         const Response& response) const;
};

} // namespace blobpipe::storage

#endif // BLOBPIPE_STORAGE_S3_OBJECT_STORE_HPP
