#include "pipeline/pipeline.hpp"
#include <boost/log/trivial.hpp>
#include "pipeline/sidecars.hpp"

namespace blobpipe::pipeline {

const char* to_string(Stage stage) {
  switch (stage) {
    case Stage::ComputeDigest:    return "ComputeDigest";
    case Stage::UploadPrimary:    return "UploadPrimary";
    case Stage::UploadSidecars:   return "UploadSidecars";
    case Stage::RegisterMetadata: return "RegisterMetadata";
    case Stage::FetchMetadata:    return "FetchMetadata";
    case Stage::DownloadPrimary:  return "DownloadPrimary";
    case Stage::VerifyIntegrity:  return "VerifyIntegrity";
    case Stage::RecordUsage:      return "RecordUsage";
    case Stage::Done:             return "Done";
    default:                      return "Unknown";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Pipeline::Pipeline(transfer::TransferClient& client, MetadataRegistry& registry, std::string user_agent)
  : client_(client)
  , registry_(registry)
  , user_agent_(std::move(user_agent))
  , verifier_(engine_) {}

//==============================================
// OPERATIONS
//==============================================

FileRecord Pipeline::upload(const UploadRequest& request) {
  return run_coroutine(io_context_, [&](CoroutineContext context) {
    return async_upload(request, context);
  });
}

DownloadResult Pipeline::download(const DownloadRequest& request) {
  return run_coroutine(io_context_, [&](CoroutineContext context) {
    return async_download(request, context);
  });
}

void Pipeline::remove(const storage::ObjectLocation& location, bool delete_sidecars) {
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Removing " << location.bucket << "/" << location.object_key()
                          << (delete_sidecars ? " with sidecars" : "");
  remove_object(client_, location, delete_sidecars);
}

//==============================================
// COOPERATIVE OPERATIONS
//==============================================

FileRecord Pipeline::async_upload(const UploadRequest& request, CoroutineContext context) {
  const std::string key = request.location.object_key();

  enter(Stage::ComputeDigest, key);
  const digest::DigestResult digest = engine_.async_compute(request.source, context);
  BOOST_LOG_TRIVIAL(debug) << "Pipeline: " << request.source << " sha256 " << digest.sha256;

  enter(Stage::UploadPrimary, key);
  client_.async_upload(request.source, request.location, request.transfer, context);

  if (request.create_sidecars) {
    enter(Stage::UploadSidecars, key);
    async_upload_sidecars(client_, request.location, digest, context);
  }

  enter(Stage::RegisterMetadata, key);
  FileRecord record = registry_.register_file(digest, request.location, request.metadata);

  enter(Stage::Done, key);
  return record;
}

DownloadResult Pipeline::async_download(const DownloadRequest& request, CoroutineContext context) {
  const std::string key = request.location.object_key();

  enter(Stage::FetchMetadata, key);
  FileRecord record = registry_.lookup(request.location);

  enter(Stage::DownloadPrimary, key);
  std::filesystem::path path = client_.async_download(request.location, request.destination,
                                                      request.transfer, context);

  if (request.verify) {
    if (record.digest.sha256.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "Pipeline: Record " << record.id << " has no sha256, skipping verification";
    } else {
      enter(Stage::VerifyIntegrity, key);
      verifier_.async_verify(path, record.digest.sha256, digest::Algorithm::Sha256, context);
    }
  }

  enter(Stage::RecordUsage, key);
  registry_.record_download(DownloadRecord{record.id, request.location, request.ip_address,
                                           request.user_agent.value_or(user_agent_)});

  enter(Stage::Done, key);
  return DownloadResult{std::move(path), std::move(record)};
}

//==============================================
// SETTERS
//==============================================

void Pipeline::set_stage_observer(StageObserver observer) {
  stage_observer_ = std::move(observer);
}

void Pipeline::enter(Stage stage, const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "Pipeline: " << to_string(stage) << " [" << key << "]";
  if (stage_observer_) {
    stage_observer_(stage);
  }
}

} // namespace blobpipe::pipeline
