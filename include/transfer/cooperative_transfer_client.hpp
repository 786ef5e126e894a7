#ifndef BLOBPIPE_TRANSFER_COOPERATIVE_CLIENT_HPP
#define BLOBPIPE_TRANSFER_COOPERATIVE_CLIENT_HPP

#include <thread>
#include <boost/asio/io_context.hpp>
#include "common/coroutine_context.hpp"
#include "storage/object_store.hpp"
#include "transfer/transfer_client.hpp"

namespace blobpipe::transfer {

// TransferClient running the parts of a multipart transfer as stackful
// coroutines on a single-threaded io_context, at most plan.concurrency in
// flight. Parts suspend at store I/O through the store's async_ operations.
//
// The blocking interface drives the client's own io_context and must not be
// entered from two threads at once. Callers already inside a coroutine use the
// async_ operations with their own context instead.
class CooperativeTransferClient : public TransferClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CooperativeTransferClient(storage::ObjectStore& store,
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


  // ---- COOPERATIVE TRANSFERS ----
  std::string async_upload(const std::filesystem::path& source, const storage::ObjectLocation& location,
                           const UploadOptions& options, CoroutineContext context) override;
  void async_upload_bytes(const std::string& data, const std::string& bucket, const std::string& key,
                          const std::string& content_type, CoroutineContext context) override;
  std::filesystem::path async_download(const storage::ObjectLocation& location,
                                       const std::filesystem::path& destination,
                                       const DownloadOptions& options, CoroutineContext context) override;


  // ---- GETTERS ----
  const TransferConfig& default_config() const { return default_config_; }

private:
  // ---- PARAMETERS ----
  storage::ObjectStore& store_;
  TransferConfig default_config_;
  boost::asio::io_context io_context_;


  // ---- MULTIPART ----
  void upload_parts(const std::filesystem::path& source, const std::string& bucket,
                    const std::string& key, const std::string& content_type,
                    std::uint64_t size, const Multipart& plan, ProgressAggregator& progress,
                    CoroutineContext context);
  void download_parts(const std::string& bucket, const std::string& key,
                      const std::filesystem::path& destination, std::uint64_t size,
                      const Multipart& plan, ProgressAggregator& progress, CoroutineContext context);
  // Abort failures are logged, never thrown
  void abort_upload(const std::string& bucket, const std::string& key, const std::string& upload_id,
                    CoroutineContext context);
};

} // namespace blobpipe::transfer

#endif // BLOBPIPE_TRANSFER_COOPERATIVE_CLIENT_HPP
