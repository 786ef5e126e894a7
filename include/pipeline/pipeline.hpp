#ifndef BLOBPIPE_PIPELINE_HPP
#define BLOBPIPE_PIPELINE_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include "common/coroutine_context.hpp"
#include "digest/digest_engine.hpp"
#include "integrity/integrity_verifier.hpp"
#include "pipeline/metadata_registry.hpp"
#include "transfer/transfer_client.hpp"

namespace blobpipe::pipeline {

constexpr const char* DEFAULT_USER_AGENT = "blobpipe/1.0";

enum class Stage {
  // Upload
  ComputeDigest,
  UploadPrimary,
  UploadSidecars,
  RegisterMetadata,
  // Download
  FetchMetadata,
  DownloadPrimary,
  VerifyIntegrity,
  RecordUsage,
  Done
};

const char* to_string(Stage stage);

using StageObserver = std::function<void(Stage)>;

struct UploadRequest {
  std::filesystem::path source;
  storage::ObjectLocation location;
  FileMetadata metadata;
  transfer::UploadOptions transfer;
  bool create_sidecars = false;
};

struct DownloadRequest {
  storage::ObjectLocation location;
  std::filesystem::path destination;
  std::string ip_address;
  // Falls back to the pipeline's user agent
  std::optional<std::string> user_agent;
  transfer::DownloadOptions transfer;
  bool verify = false;
};

struct DownloadResult {
  std::filesystem::path path;
  FileRecord record;
};

// Sequences digest, transfer, sidecar, verification and registry steps.
// Every step runs only after the previous one succeeded; a failure leaves the
// effects of earlier steps in place and propagates unchanged.
//
// The blocking operations run the cooperative ones on the pipeline's own
// io_context and must not be entered from two threads at once.
class Pipeline {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Pipeline(transfer::TransferClient& client, MetadataRegistry& registry,
           std::string user_agent = DEFAULT_USER_AGENT);


  // ---- OPERATIONS ----
  // ComputeDigest -> UploadPrimary -> [UploadSidecars] -> RegisterMetadata
  FileRecord upload(const UploadRequest& request);
  // FetchMetadata -> DownloadPrimary -> [VerifyIntegrity] -> RecordUsage
  DownloadResult download(const DownloadRequest& request);
  // Deletes the primary object and optionally its sidecars
  void remove(const storage::ObjectLocation& location, bool delete_sidecars);


  // ---- COOPERATIVE OPERATIONS ----
  // Same stages for callers running as a coroutine on context.io_context.
  // Digests and transfers suspend instead of blocking the thread.
  FileRecord async_upload(const UploadRequest& request, CoroutineContext context);
  DownloadResult async_download(const DownloadRequest& request, CoroutineContext context);


  // ---- SETTERS ----
  void set_stage_observer(StageObserver observer);

private:
  // ---- PARAMETERS ----
  transfer::TransferClient& client_;
  MetadataRegistry& registry_;
  std::string user_agent_;
  digest::DigestEngine engine_;
  integrity::IntegrityVerifier verifier_;
  StageObserver stage_observer_;
  // Drives the blocking operations
  boost::asio::io_context io_context_;

  void enter(Stage stage, const std::string& key);
};

} // namespace blobpipe::pipeline

#endif // BLOBPIPE_PIPELINE_HPP
