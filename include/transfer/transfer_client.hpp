#ifndef BLOBPIPE_TRANSFER_CLIENT_HPP
#define BLOBPIPE_TRANSFER_CLIENT_HPP

#include <filesystem>
#include <optional>
#include <string>
#include "common/coroutine_context.hpp"
#include "storage/object_location.hpp"
#include "transfer/progress_aggregator.hpp"
#include "transfer/transfer_policy.hpp"

namespace blobpipe::transfer {

struct UploadOptions {
  // Sent with the object when set
  std::optional<std::string> content_type;
  // Overrides the client's default configuration for this call
  std::optional<TransferConfig> config;
  ProgressObserver observer;
};

struct DownloadOptions {
  std::optional<TransferConfig> config;
  ProgressObserver observer;
};

// Moves whole files between the local filesystem and an object store.
// Store and local I/O failures are reported as UploadFailure / DownloadFailure.
class TransferClient {
public:
  virtual ~TransferClient() = default;

  // ---- TRANSFERS ----
  // Uploads source to location.object_key() and returns the key. Throws
  // SourceNotFound before contacting the store when source does not exist.
  virtual std::string upload(const std::filesystem::path& source,
                             const storage::ObjectLocation& location,
                             const UploadOptions& options) = 0;

  // Single-shot upload of an in-memory payload
  virtual void upload_bytes(const std::string& data, const std::string& bucket,
                            const std::string& key, const std::string& content_type) = 0;

  // Downloads the object to destination, creating parent directories as
  // needed, and returns destination
  virtual std::filesystem::path download(const storage::ObjectLocation& location,
                                         const std::filesystem::path& destination,
                                         const DownloadOptions& options) = 0;


  // ---- OBJECT MANAGEMENT ----
  virtual bool exists(const std::string& bucket, const std::string& key) = 0;
  // Removing a missing object succeeds
  virtual void remove(const std::string& bucket, const std::string& key) = 0;


  // ---- COOPERATIVE TRANSFERS ----
  // Same contracts as the blocking calls, for callers running as a coroutine
  // on context.io_context. The defaults run the blocking call and then yield.
  virtual std::string async_upload(const std::filesystem::path& source,
                                   const storage::ObjectLocation& location,
                                   const UploadOptions& options, CoroutineContext context);
  virtual void async_upload_bytes(const std::string& data, const std::string& bucket,
                                  const std::string& key, const std::string& content_type,
                                  CoroutineContext context);
  virtual std::filesystem::path async_download(const storage::ObjectLocation& location,
                                               const std::filesystem::path& destination,
                                               const DownloadOptions& options, CoroutineContext context);
};

} // namespace blobpipe::transfer

#endif // BLOBPIPE_TRANSFER_CLIENT_HPP
