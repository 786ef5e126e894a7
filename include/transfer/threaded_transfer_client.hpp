#ifndef BLOBPIPE_TRANSFER_THREADED_CLIENT_HPP
#define BLOBPIPE_TRANSFER_THREADED_CLIENT_HPP

#include <thread>
#include "storage/object_store.hpp"
#include "transfer/transfer_client.hpp"

namespace blobpipe::transfer {

// TransferClient running the parts of a multipart transfer on a
// boost::asio::thread_pool sized by the plan's concurrency. The pool lives for
// one call; the store must be safe to use from several threads.
class ThreadedTransferClient : public TransferClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ThreadedTransferClient(storage::ObjectStore& store,
                                  TransferConfig default_config
                                    = make_default_config(std::thread::hardware_concurrency()));


  // ---- TRANSFERS ----
  std::string upload(const std::filesystem::path& source, const storage::ObjectLocation& location,
                     const UploadOptions& options) override;
  void upload_bytes(const std::string& data, const std::string& bucket,
                    const std::string& key, const std::string& content_type) override;
  std::filesystem::path download(const storage::ObjectLocation& location,
                                 const std::filesystem::path& destination,
                                 const DownloadOptions& options) override;


  // ---- OBJECT MANAGEMENT ----
  bool exists(const std::string& bucket, const std::string& key) override;
  void remove(const std::string& bucket, const std::string& key) override;


  // ---- GETTERS ----
  const TransferConfig& default_config() const { return default_config_; }

private:
  // ---- PARAMETERS ----
  storage::ObjectStore& store_;
  TransferConfig default_config_;


  // ---- MULTIPART ----
  void upload_parts(const std::filesystem::path& source, const std::string& bucket,
                    const std::string& key, const std::string& content_type,
                    std::uint64_t size, const Multipart& plan, ProgressAggregator& progress);
  void download_parts(const std::string& bucket, const std::string& key,
                      const std::filesystem::path& destination, std::uint64_t size,
                      const Multipart& plan, ProgressAggregator& progress);
  // Abort failures are logged, never thrown
  void abort_upload(const std::string& bucket, const std::string& key, const std::string& upload_id);
};

} // namespace blobpipe::transfer

#endif // BLOBPIPE_TRANSFER_THREADED_CLIENT_HPP
