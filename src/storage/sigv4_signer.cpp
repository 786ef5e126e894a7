#include "storage/sigv4_signer.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include "storage/storage_error.hpp"

namespace blobpipe::storage {

namespace {

const char* ALGORITHM = "AWS4-HMAC-SHA256";

std::string to_hex(const std::string& bytes) {
  std::stringstream ss;
  for (unsigned char c : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SigV4Signer::SigV4Signer(std::string access_key_id, std::string secret_access_key,
                         std::string region, std::string service)
  : access_key_id_(std::move(access_key_id))
  , secret_access_key_(std::move(secret_access_key))
  , region_(std::move(region))
  , service_(std::move(service)) {}

//==============================================
// SIGNING
//==============================================

std::string SigV4Signer::authorization(const SigningRequest& request, const std::string& amz_date) const {
  return std::string(ALGORITHM)
    + " Credential=" + access_key_id_ + "/" + credential_scope(amz_date)
    + ", SignedHeaders=" + signed_headers(request)
    + ", Signature=" + signature(request, amz_date);
}

std::string SigV4Signer::signature(const SigningRequest& request, const std::string& amz_date) const {
  const std::string key = signing_key(amz_date.substr(0, 8));
  return to_hex(hmac_sha256(key, string_to_sign(request, amz_date)));
}

std::string SigV4Signer::canonical_request(const SigningRequest& request) const {
  std::vector<std::pair<std::string, std::string>> query;
  query.reserve(request.query.size());
  for (const auto& [name, value] : request.query) {
    query.emplace_back(uri_encode(name), uri_encode(value));
  }
  std::sort(query.begin(), query.end());

  std::string canonical_query;
  for (const auto& [name, value] : query) {
    if (!canonical_query.empty()) {
      canonical_query += "&";
    }
    canonical_query += name + "=" + value;
  }

  // std::map keeps header names sorted
  std::string canonical_headers;
  for (const auto& [name, value] : request.headers) {
    canonical_headers += name + ":" + trim(value) + "\n";
  }

  return request.method + "\n"
    + request.canonical_uri + "\n"
    + canonical_query + "\n"
    + canonical_headers + "\n"
    + signed_headers(request) + "\n"
    + request.payload_hash;
}

std::string SigV4Signer::string_to_sign(const SigningRequest& request, const std::string& amz_date) const {
  return std::string(ALGORITHM) + "\n"
    + amz_date + "\n"
    + credential_scope(amz_date) + "\n"
    + sha256_hex(canonical_request(request));
}

//==============================================
// HELPERS
//==============================================

std::string SigV4Signer::sha256_hex(const std::string& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr)) {
    throw StorageError("SigV4: Failed to hash payload");
  }
  return to_hex(std::string(reinterpret_cast<const char*>(hash), hash_len));
}

std::string SigV4Signer::hmac_sha256(const std::string& key, const std::string& data) {
  unsigned char mac[EVP_MAX_MD_SIZE];
  unsigned int mac_len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac, &mac_len)) {
    throw StorageError("SigV4: Failed to compute HMAC");
  }
  return std::string(reinterpret_cast<const char*>(mac), mac_len);
}

std::string SigV4Signer::uri_encode(const std::string& value, bool encode_slash) {
  std::stringstream ss;
  for (unsigned char c : value) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                         || c == '-' || c == '_' || c == '.' || c == '~';
    if (unreserved || (c == '/' && !encode_slash)) {
      ss << c;
    } else {
      ss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
         << static_cast<int>(c) << std::nouppercase << std::dec;
    }
  }
  return ss.str();
}

std::string SigV4Signer::format_amz_date(std::chrono::system_clock::time_point time) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[17];
  std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &utc);
  return buffer;
}

std::string SigV4Signer::credential_scope(const std::string& amz_date) const {
  return amz_date.substr(0, 8) + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string SigV4Signer::signed_headers(const SigningRequest& request) const {
  std::string names;
  for (const auto& header : request.headers) {
    if (!names.empty()) {
      names += ";";
    }
    names += header.first;
  }
  return names;
}

std::string SigV4Signer::signing_key(const std::string& date) const {
  const std::string date_key = hmac_sha256("AWS4" + secret_access_key_, date);
  const std::string region_key = hmac_sha256(date_key, region_);
  const std::string service_key = hmac_sha256(region_key, service_);
  return hmac_sha256(service_key, "aws4_request");
}

} // namespace blobpipe::storage
