#ifndef BLOBPIPE_PIPELINE_SIDECARS_HPP
#define BLOBPIPE_PIPELINE_SIDECARS_HPP

#include <string>
#include "digest/digest_result.hpp"
#include "storage/object_location.hpp"
#include "transfer/transfer_client.hpp"

namespace blobpipe::pipeline {

constexpr const char* SIDECAR_CONTENT_TYPE = "text/plain";

// Uploads one "<hex>  <filename>\n" object per algorithm next to the primary
// object. Stops at the first failure (UploadFailure).
void upload_sidecars(transfer::TransferClient& client, const storage::ObjectLocation& location,
                     const digest::DigestResult& digest);
void async_upload_sidecars(transfer::TransferClient& client, const storage::ObjectLocation& location,
                           const digest::DigestResult& digest, CoroutineContext context);

// Deletes the primary object and, when delete_sidecars is set, its sidecars.
// Primary failures propagate; sidecar failures are logged and suppressed.
void remove_object(transfer::TransferClient& client, const storage::ObjectLocation& location,
                   bool delete_sidecars);

// Extracts the hex digest from a sidecar body, empty when the body is malformed
std::string parse_sidecar(const std::string& content);

} // namespace blobpipe::pipeline

#endif // BLOBPIPE_PIPELINE_SIDECARS_HPP
