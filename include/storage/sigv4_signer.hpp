#ifndef BLOBPIPE_STORAGE_SIGV4_SIGNER_HPP
#define BLOBPIPE_STORAGE_SIGV4_SIGNER_HPP

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace blobpipe::storage {

// Request fields covered by an AWS Signature Version 4 signature
struct SigningRequest {
  std::string method;
  // Already URI-encoded absolute path, e.g. "/bucket/some%20key"
  std::string canonical_uri;
  // Unencoded query parameters; a parameter without value has an empty string
  std::vector<std::pair<std::string, std::string>> query;
  // Headers to sign, names in lowercase
  std::map<std::string, std::string> headers;
  // Hex SHA-256 of the payload
  std::string payload_hash;
};

class SigV4Signer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SigV4Signer(std::string access_key_id, std::string secret_access_key,
              std::string region, std::string service = "s3");


  // ---- SIGNING ----
  // Value of the Authorization header for the request signed at amz_date
  // (format "YYYYMMDDTHHMMSSZ")
  std::string authorization(const SigningRequest& request, const std::string& amz_date) const;
  // Hex signature only
  std::string signature(const SigningRequest& request, const std::string& amz_date) const;

  std::string canonical_request(const SigningRequest& request) const;
  std::string string_to_sign(const SigningRequest& request, const std::string& amz_date) const;


  // ---- HELPERS ----
  static std::string sha256_hex(const std::string& data);
  // Raw HMAC-SHA256
  static std::string hmac_sha256(const std::string& key, const std::string& data);
  // RFC 3986 encoding as S3 expects it; '/' is kept when encode_slash is false
  static std::string uri_encode(const std::string& value, bool encode_slash = true);
  static std::string format_amz_date(std::chrono::system_clock::time_point time);

private:
  // ---- PARAMETERS ----
  std::string access_key_id_;
  std::string secret_access_key_;
  std::string region_;
  std::string service_;

  std::string credential_scope(const std::string& amz_date) const;
  std::string signed_headers(const SigningRequest& request) const;
  std::string signing_key(const std::string& date) const;
};

} // namespace blobpipe::storage

#endif // BLOBPIPE_STORAGE_SIGV4_SIGNER_HPP
