#include "pipeline/sidecars.hpp"
#include <cctype>
#include <boost/log/trivial.hpp>

namespace blobpipe::pipeline {

void upload_sidecars(transfer::TransferClient& client, const storage::ObjectLocation& location,
                     const digest::DigestResult& digest) {
  const std::string key = location.object_key();
  for (const digest::Algorithm algorithm : digest::ALL_ALGORITHMS) {
    client.upload_bytes(storage::sidecar_content(digest.hex(algorithm), location.filename),
                        location.bucket, storage::sidecar_key(key, algorithm), SIDECAR_CONTENT_TYPE);
  }
  BOOST_LOG_TRIVIAL(info) << "Sidecars: Uploaded checksum files for " << key;
}

void async_upload_sidecars(transfer::TransferClient& client, const storage::ObjectLocation& location,
                           const digest::DigestResult& digest, CoroutineContext context) {
  const std::string key = location.object_key();
  for (const digest::Algorithm algorithm : digest::ALL_ALGORITHMS) {
    client.async_upload_bytes(storage::sidecar_content(digest.hex(algorithm), location.filename),
                              location.bucket, storage::sidecar_key(key, algorithm), SIDECAR_CONTENT_TYPE,
                              context);
  }
  BOOST_LOG_TRIVIAL(info) << "Sidecars: Uploaded checksum files for " << key;
}

void remove_object(transfer::TransferClient& client, const storage::ObjectLocation& location,
                   bool delete_sidecars) {
  const std::string key = location.object_key();
  client.remove(location.bucket, key);

  if (!delete_sidecars) {
    return;
  }
  for (const digest::Algorithm algorithm : digest::ALL_ALGORITHMS) {
    const std::string sidecar = storage::sidecar_key(key, algorithm);
    try {
      client.remove(location.bucket, sidecar);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Sidecars: Ignoring failure to delete " << sidecar << ": " << e.what();
    }
  }
}

std::string parse_sidecar(const std::string& content) {
  std::size_t end = 0;
  while (end < content.size() && std::isxdigit(static_cast<unsigned char>(content[end]))) {
    ++end;
  }
  if (end == 0 || (end < content.size() && content[end] != ' ' && content[end] != '\n')) {
    return "";
  }
  return content.substr(0, end);
}

} // namespace blobpipe::pipeline
