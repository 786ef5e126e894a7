#ifndef BLOBPIPE_COMMON_ERROR_HPP
#define BLOBPIPE_COMMON_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobpipe {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string& message)
    : std::runtime_error(message) {}
};

// Local read/write failure
class IoError : public Error {
public:
  explicit IoError(const std::string& message)
    : Error("I/O error: " + message) {}
};

// Local source missing before a transfer or digest is started
class SourceNotFound : public IoError {
public:
  explicit SourceNotFound(const std::string& path)
    : IoError("Source not found: " + path)
    , path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

class DigestError : public Error {
public:
  explicit DigestError(const std::string& message)
    : Error("Digest error: " + message) {}
};

// Malformed object identifier
class InvalidLocation : public Error {
public:
  explicit InvalidLocation(const std::string& message)
    : Error("Invalid location: " + message) {}
};


enum class TransferDirection {
  Upload,
  Download
};

inline const char* to_string(TransferDirection direction) {
  switch (direction) {
    case TransferDirection::Upload:   return "upload";
    case TransferDirection::Download: return "download";
    default:                          return "unknown";
  }
}

// Wraps any store or local I/O failure raised while moving bytes
class TransferFailure : public Error {
public:
  TransferFailure(TransferDirection direction, const std::string& key, const std::string& cause)
    : Error(std::string("Failed to ") + to_string(direction) + " '" + key + "': " + cause)
    , direction_(direction)
    , key_(key)
    , cause_(cause) {}

  TransferDirection direction() const { return direction_; }
  const std::string& key() const { return key_; }
  const std::string& cause() const { return cause_; }

private:
  TransferDirection direction_;
  std::string key_;
  std::string cause_;
};

class UploadFailure : public TransferFailure {
public:
  UploadFailure(const std::string& key, const std::string& cause)
    : TransferFailure(TransferDirection::Upload, key, cause) {}
};

class DownloadFailure : public TransferFailure {
public:
  DownloadFailure(const std::string& key, const std::string& cause)
    : TransferFailure(TransferDirection::Download, key, cause) {}
};

// Post-download verification failure
class ChecksumMismatch : public Error {
public:
  ChecksumMismatch(const std::string& algorithm, const std::string& path,
                   const std::string& expected, const std::string& actual)
    : Error(algorithm + " checksum mismatch for " + path + " (expected " + expected
            + ", got " + actual + ")")
    , algorithm_(algorithm)
    , path_(path)
    , expected_(expected)
    , actual_(actual) {}

  const std::string& algorithm() const { return algorithm_; }
  const std::string& path() const { return path_; }
  const std::string& expected() const { return expected_; }
  const std::string& actual() const { return actual_; }

private:
  std::string algorithm_;
  std::string path_;
  std::string expected_;
  std::string actual_;
};

} // namespace blobpipe

#endif // BLOBPIPE_COMMON_ERROR_HPP
