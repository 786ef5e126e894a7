#include "storage/local_object_store.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <thread>
#include <boost/log/trivial.hpp>

namespace blobpipe {
namespace storage {

namespace {

const char* MULTIPART_DIR = ".multipart";

std::string to_hex(const unsigned char* bytes, unsigned int length) {
  std::stringstream ss;
  for (unsigned int i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

std::string digest_hex(const EVP_MD* md, const std::string& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_Digest(data.data(), data.size(), hash, &hash_len, md, nullptr)) {
    throw StorageError("Local store: Failed to compute digest");
  }
  return to_hex(hash, hash_len);
}

std::string quoted(const std::string& value) {
  return "\"" + value + "\"";
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalObjectStore::LocalObjectStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Initializing store with base path: " << base_path_.string();
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Local store: Store directory created/verified at: " << base_path_.string();
}


//==============================================
// SINGLE-SHOT OPERATIONS
//==============================================

std::string LocalObjectStore::put_object(const std::string& bucket, const std::string& key,
                                         const std::string& body, const std::string& content_type) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Storing " << body.size() << " bytes with key: " << bucket << "/" << key;

  std::filesystem::path file_path = resolve_key_path(bucket, key);
  check_directory_exists(file_path.parent_path());

  const std::string etag = quoted(digest_hex(EVP_md5(), body));
  write_file(file_path, body);
  write_meta(file_path, content_type, etag);

  BOOST_LOG_TRIVIAL(debug) << "Local store: Stored key " << key << " at: " << file_path.string();
  return etag;
}

std::string LocalObjectStore::get_object(const std::string& bucket, const std::string& key,
                                         const std::optional<ByteRange>& range) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Retrieving data for key: " << bucket << "/" << key;

  std::filesystem::path file_path = resolve_key_path(bucket, key);
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Object not found: " << key;
    throw ObjectNotFound(key);
  }

  const std::uint64_t size = std::filesystem::file_size(file_path);
  if (!range) {
    return read_file(file_path, 0, size);
  }

  if (range->offset >= size && range->length > 0) {
    throw StorageError("Local store: Requested range not satisfiable for key: " + key, 416,
                       "InvalidRange");
  }
  const std::uint64_t length = std::min(range->length, size - std::min(range->offset, size));
  return read_file(file_path, range->offset, length);
}

std::optional<ObjectInfo> LocalObjectStore::head_object(const std::string& bucket, const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Local store: Checking existence of key: " << bucket << "/" << key;

  std::filesystem::path file_path = resolve_key_path(bucket, key);
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Local store: Key " << key << " not found";
    return std::nullopt;
  }

  ObjectInfo info;
  info.size = std::filesystem::file_size(file_path);

  std::ifstream meta(meta_path(file_path));
  if (meta) {
    std::getline(meta, info.content_type);
    std::getline(meta, info.etag);
  }
  return info;
}

void LocalObjectStore::delete_object(const std::string& bucket, const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Removing object with key: " << bucket << "/" << key;

  std::filesystem::path file_path = resolve_key_path(bucket, key);
  std::error_code ec;
  const bool removed = std::filesystem::remove(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to remove object " << key << ": " << ec.message();
    throw StorageError("Local store: Failed to remove object " + key + ": " + ec.message());
  }
  if (!std::filesystem::remove(meta_path(file_path), ec) && ec) {
    BOOST_LOG_TRIVIAL(warning) << "Local store: Failed to remove metadata of " << key << ": " << ec.message();
  }

  if (!removed) {
    BOOST_LOG_TRIVIAL(debug) << "Local store: Nothing to remove for key: " << key;
    return;
  }

  prune_empty_dirs(file_path.parent_path(), base_path_ / bucket);
  BOOST_LOG_TRIVIAL(info) << "Local store: Successfully removed object with key: " << key;
}


//==============================================
// MULTIPART UPLOAD
//==============================================

std::string LocalObjectStore::create_multipart_upload(const std::string& bucket, const std::string& key,
                                                      const std::string& content_type) {
  unsigned char random[16];
  if (RAND_bytes(random, sizeof(random)) != 1) {
    throw StorageError("Local store: Failed to generate upload id");
  }
  const std::string upload_id = to_hex(random, sizeof(random));

  std::filesystem::path dir = upload_dir(upload_id);
  check_directory_exists(dir);

  std::ofstream target(dir / "target", std::ios::trunc);
  target << bucket << '\n' << key << '\n' << content_type << '\n';
  if (!target) {
    throw StorageError("Local store: Failed to record multipart upload for key: " + key);
  }

  BOOST_LOG_TRIVIAL(info) << "Local store: Started multipart upload " << upload_id << " for key: " << key;
  return upload_id;
}

std::string LocalObjectStore::upload_part(const std::string& bucket, const std::string& key,
                                          const std::string& upload_id, int part_number,
                                          const std::string& body) {
  verify_upload_exists(upload_id);
  if (part_number < 1 || part_number > 10000) {
    throw StorageError("Local store: Invalid part number " + std::to_string(part_number), 400,
                       "InvalidArgument");
  }

  const std::filesystem::path part_path = upload_dir(upload_id) / (std::to_string(part_number) + ".part");
  const std::string etag = quoted(digest_hex(EVP_md5(), body));
  write_file(part_path, body);

  std::ofstream etag_file(part_path.string() + ".etag", std::ios::trunc);
  etag_file << etag;

  BOOST_LOG_TRIVIAL(debug) << "Local store: Stored part " << part_number << " (" << body.size()
                           << " bytes) of upload " << upload_id << " for key: " << bucket << "/" << key;
  return etag;
}

void LocalObjectStore::complete_multipart_upload(const std::string& bucket, const std::string& key,
                                                 const std::string& upload_id,
                                                 const std::vector<CompletedPart>& parts) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Completing multipart upload " << upload_id
                          << " with " << parts.size() << " parts for key: " << key;
  verify_upload_exists(upload_id);

  if (parts.empty()) {
    throw StorageError("Local store: Multipart upload needs at least one part", 400, "MalformedXML");
  }

  const std::filesystem::path dir = upload_dir(upload_id);
  std::string content_type;
  {
    std::ifstream target(dir / "target");
    std::string target_bucket, target_key;
    std::getline(target, target_bucket);
    std::getline(target, target_key);
    std::getline(target, content_type);
    if (target_bucket != bucket || target_key != key) {
      throw StorageError("Local store: Upload " + upload_id + " does not belong to key " + key, 400,
                         "NoSuchUpload");
    }
  }

  std::string etags;
  int previous = 0;
  for (const auto& part : parts) {
    if (part.part_number <= previous) {
      throw StorageError("Local store: Parts must be listed in ascending order", 400, "InvalidPartOrder");
    }
    previous = part.part_number;

    const std::filesystem::path part_path = dir / (std::to_string(part.part_number) + ".part");
    if (!std::filesystem::exists(part_path)) {
      throw StorageError("Local store: Missing part " + std::to_string(part.part_number), 400, "InvalidPart");
    }

    std::string stored_etag;
    std::ifstream etag_file(part_path.string() + ".etag");
    std::getline(etag_file, stored_etag);
    if (stored_etag != part.etag) {
      throw StorageError("Local store: ETag mismatch for part " + std::to_string(part.part_number), 400,
                         "InvalidPart");
    }
    etags += stored_etag;
  }

  // Parts are appended one at a time so the object is never held in memory
  const std::filesystem::path assembled = dir / "assembled";
  std::uint64_t total_bytes = 0;
  {
    std::ofstream output(assembled, std::ios::binary | std::ios::trunc);
    if (!output) {
      throw StorageError("Local store: Failed to create file: " + assembled.string());
    }
    for (const auto& part : parts) {
      const std::filesystem::path part_path = dir / (std::to_string(part.part_number) + ".part");
      total_bytes += std::filesystem::file_size(part_path);
      if (std::filesystem::file_size(part_path) == 0) {
        continue;
      }
      std::ifstream input(part_path, std::ios::binary);
      output << input.rdbuf();
    }
    if (!output) {
      throw StorageError("Local store: Failed to assemble parts for key: " + key);
    }
  }

  std::filesystem::path file_path = resolve_key_path(bucket, key);
  check_directory_exists(file_path.parent_path());
  std::filesystem::rename(assembled, file_path);
  write_meta(file_path, content_type,
             quoted(digest_hex(EVP_md5(), etags) + "-" + std::to_string(parts.size())));

  std::filesystem::remove_all(dir);
  BOOST_LOG_TRIVIAL(info) << "Local store: Assembled " << total_bytes << " bytes for key: " << key;
}

void LocalObjectStore::abort_multipart_upload(const std::string& bucket, const std::string& key,
                                              const std::string& upload_id) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Aborting multipart upload " << upload_id
                          << " for key: " << bucket << "/" << key;
  verify_upload_exists(upload_id);
  std::filesystem::remove_all(upload_dir(upload_id));
}


//==============================================
// MAINTENANCE
//==============================================

void LocalObjectStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Local store: Clearing entire store at: " << base_path_.string();
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(info) << "Local store: Store cleared successfully";
}

std::size_t LocalObjectStore::pending_uploads() const {
  const std::filesystem::path dir = base_path_ / MULTIPART_DIR;
  if (!std::filesystem::exists(dir)) {
    return 0;
  }
  std::size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.is_directory()) {
      ++count;
    }
  }
  return count;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string LocalObjectStore::hash_key(const std::string& key) const {
  return digest_hex(EVP_sha256(), key);
}

std::filesystem::path LocalObjectStore::get_path_for_hash(const std::string& bucket,
                                                          const std::string& hash) const {
  std::filesystem::path path = base_path_ / bucket;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

std::filesystem::path LocalObjectStore::resolve_key_path(const std::string& bucket,
                                                         const std::string& key) const {
  if (bucket.empty() || bucket == MULTIPART_DIR) {
    throw StorageError("Local store: Invalid bucket name: '" + bucket + "'", 400, "InvalidBucketName");
  }
  return get_path_for_hash(bucket, hash_key(key));
}

std::filesystem::path LocalObjectStore::meta_path(const std::filesystem::path& object_path) const {
  return object_path.string() + ".meta";
}

std::filesystem::path LocalObjectStore::upload_dir(const std::string& upload_id) const {
  return base_path_ / MULTIPART_DIR / upload_id;
}


//==============================================
// FILE HELPERS
//==============================================

void LocalObjectStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void LocalObjectStore::write_file(const std::filesystem::path& path, const std::string& content) const {
  // Unique per writer so concurrent puts of one key never share a temporary
  std::stringstream suffix;
  suffix << ".tmp." << std::this_thread::get_id() << "." << reinterpret_cast<std::uintptr_t>(&content);
  const std::filesystem::path temp_path = path.string() + suffix.str();

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StorageError("Local store: Failed to create file: " + temp_path.string());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
      throw StorageError("Local store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    throw StorageError("Local store: Failed to move file into place: " + path.string());
  }
}

std::string LocalObjectStore::read_file(const std::filesystem::path& path, std::uint64_t offset,
                                        std::uint64_t length) const {
  std::string content(static_cast<std::size_t>(length), '\0');
  if (length == 0) {
    return content;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StorageError("Local store: Failed to open file: " + path.string());
  }
  file.seekg(static_cast<std::streamoff>(offset));
  file.read(&content[0], static_cast<std::streamsize>(length));
  if (static_cast<std::uint64_t>(file.gcount()) != length) {
    throw StorageError("Local store: Short read from file: " + path.string());
  }
  return content;
}

void LocalObjectStore::write_meta(const std::filesystem::path& object_path, const std::string& content_type,
                                  const std::string& etag) const {
  write_file(meta_path(object_path), content_type + "\n" + etag + "\n");
}

void LocalObjectStore::prune_empty_dirs(std::filesystem::path current,
                                        const std::filesystem::path& stop) const {
  std::error_code ec;
  while (current != stop && current.has_parent_path()) {
    if (!std::filesystem::is_empty(current, ec) || ec) {
      break;
    }
    std::filesystem::remove(current, ec);
    current = current.parent_path();
  }
}

void LocalObjectStore::verify_upload_exists(const std::string& upload_id) const {
  if (upload_id.empty() || !std::filesystem::exists(upload_dir(upload_id))) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Unknown multipart upload: " << upload_id;
    throw StorageError("Local store: Unknown multipart upload: " + upload_id, 404, "NoSuchUpload");
  }
}

} // namespace storage
} // namespace blobpipe
