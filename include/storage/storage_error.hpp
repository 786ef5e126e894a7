#ifndef BLOBPIPE_STORAGE_ERROR_HPP
#define BLOBPIPE_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobpipe::storage {

// Failure reported by an object store backend. status is the HTTP status of
// the failed exchange, or 0 when no response was received.
class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& message, unsigned int status = 0,
                        const std::string& code = "")
    : std::runtime_error(message)
    , status_(status)
    , code_(code) {}

  unsigned int status() const { return status_; }
  // S3 error code such as "NoSuchKey", empty when unknown
  const std::string& code() const { return code_; }

private:
  unsigned int status_;
  std::string code_;
};

class ObjectNotFound : public StorageError {
public:
  explicit ObjectNotFound(const std::string& key)
    : StorageError("Object not found: " + key, 404, "NoSuchKey") {}
};

} // namespace blobpipe::storage

#endif // BLOBPIPE_STORAGE_ERROR_HPP
