#include "transfer/transfer_client.hpp"

namespace blobpipe::transfer {

std::string TransferClient::async_upload(const std::filesystem::path& source,
                                         const storage::ObjectLocation& location,
                                         const UploadOptions& options, CoroutineContext context) {
  std::string key = upload(source, location, options);
  context.yield_now();
  return key;
}

void TransferClient::async_upload_bytes(const std::string& data, const std::string& bucket,
                                        const std::string& key, const std::string& content_type,
                                        CoroutineContext context) {
  upload_bytes(data, bucket, key, content_type);
  context.yield_now();
}

std::filesystem::path TransferClient::async_download(const storage::ObjectLocation& location,
                                                     const std::filesystem::path& destination,
                                                     const DownloadOptions& options, CoroutineContext context) {
  std::filesystem::path path = download(location, destination, options);
  context.yield_now();
  return path;
}

} // namespace blobpipe::transfer
