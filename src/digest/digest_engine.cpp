#include "digest/digest_engine.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace blobpipe::digest {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  // Create and initialize a context for the given message digest
  explicit DigestContext(const EVP_MD* md) {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create digest context");
    }
    if (!EVP_DigestInit_ex(ctx, md, nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw DigestError("Failed to initialize digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

namespace {

const EVP_MD* message_digest(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::Md5:    return EVP_md5();
    case Algorithm::Sha1:   return EVP_sha1();
    case Algorithm::Sha256: return EVP_sha256();
    case Algorithm::Sha512: return EVP_sha512();
  }
  throw DigestError("Unknown digest algorithm");
}

std::string to_hex(const unsigned char* bytes, unsigned int length) {
  std::stringstream ss;
  for (unsigned int i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

} // namespace

//==============================================
// DIGEST RESULT
//==============================================

const char* to_string(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::Md5:    return "md5";
    case Algorithm::Sha1:   return "sha1";
    case Algorithm::Sha256: return "sha256";
    case Algorithm::Sha512: return "sha512";
    default:                return "unknown";
  }
}

const std::string& DigestResult::hex(Algorithm algorithm) const {
  switch (algorithm) {
    case Algorithm::Md5:    return md5;
    case Algorithm::Sha1:   return sha1;
    case Algorithm::Sha256: return sha256;
    case Algorithm::Sha512: return sha512;
  }
  throw DigestError("Unknown digest algorithm");
}

std::ostream& operator<<(std::ostream& os, const DigestResult& result) {
  os << "size=" << result.size
     << " md5=" << result.md5
     << " sha1=" << result.sha1
     << " sha256=" << result.sha256
     << " sha512=" << result.sha512;
  return os;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MultiDigest::MultiDigest() {
  for (std::size_t i = 0; i < ALL_ALGORITHMS.size(); ++i) {
    contexts_[i] = std::make_unique<DigestContext>(message_digest(ALL_ALGORITHMS[i]));
  }
}

MultiDigest::~MultiDigest() = default;

//==============================================
// ACCUMULATION
//==============================================

void MultiDigest::update(const char* data, std::size_t length) {
  if (finalized_) {
    throw DigestError("Accumulator already finalized");
  }
  if (length == 0) {
    return;
  }

  for (auto& context : contexts_) {
    if (!EVP_DigestUpdate(context->get(), data, length)) {
      throw DigestError("Failed to update digest");
    }
  }
  size_ += length;
}

DigestResult MultiDigest::finalize() {
  if (finalized_) {
    throw DigestError("Accumulator already finalized");
  }
  finalized_ = true;

  std::array<std::string, 4> hex_digests;
  for (std::size_t i = 0; i < contexts_.size(); ++i) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!EVP_DigestFinal_ex(contexts_[i]->get(), hash, &hash_len)) {
      throw DigestError("Failed to finalize digest");
    }
    hex_digests[i] = to_hex(hash, hash_len);
  }

  DigestResult result;
  result.size = size_;
  result.md5 = hex_digests[0];
  result.sha1 = hex_digests[1];
  result.sha256 = hex_digests[2];
  result.sha512 = hex_digests[3];
  return result;
}

//==============================================
// BLOCKING DIGEST
//==============================================

DigestResult DigestEngine::compute(const std::filesystem::path& source) const {
  BOOST_LOG_TRIVIAL(info) << "Digest engine: Computing digests for: " << source.string();

  std::ifstream file;
  open_source(source, file);

  std::vector<char> buffer(BLOCK_SIZE);
  MultiDigest accumulator;
  while (std::size_t bytes_read = read_block(file, buffer.data(), source.string())) {
    accumulator.update(buffer.data(), bytes_read);
  }

  DigestResult result = accumulator.finalize();
  BOOST_LOG_TRIVIAL(info) << "Digest engine: Digested " << result.size << " bytes from: " << source.string();
  BOOST_LOG_TRIVIAL(debug) << "Digest engine: " << result;
  return result;
}

DigestResult DigestEngine::compute(std::istream& input) const {
  BOOST_LOG_TRIVIAL(debug) << "Digest engine: Computing digests for input stream";

  if (!input.good()) {
    throw IoError("Invalid input stream");
  }

  std::vector<char> buffer(BLOCK_SIZE);
  MultiDigest accumulator;
  while (std::size_t bytes_read = read_block(input, buffer.data(), "input stream")) {
    accumulator.update(buffer.data(), bytes_read);
  }

  return accumulator.finalize();
}

//==============================================
// COOPERATIVE DIGEST
//==============================================

DigestResult DigestEngine::async_compute(const std::filesystem::path& source,
                                         CoroutineContext context) const {
  BOOST_LOG_TRIVIAL(info) << "Digest engine: Computing digests cooperatively for: " << source.string();

  std::ifstream file;
  open_source(source, file);

  std::vector<char> buffer(BLOCK_SIZE);
  MultiDigest accumulator;
  while (std::size_t bytes_read = read_block(file, buffer.data(), source.string())) {
    accumulator.update(buffer.data(), bytes_read);
    context.yield_now();
  }

  DigestResult result = accumulator.finalize();
  BOOST_LOG_TRIVIAL(info) << "Digest engine: Digested " << result.size << " bytes from: " << source.string();
  return result;
}

//==============================================
// UTILITY METHODS
//==============================================

void DigestEngine::open_source(const std::filesystem::path& source, std::ifstream& file) const {
  if (!std::filesystem::exists(source)) {
    BOOST_LOG_TRIVIAL(error) << "Digest engine: Source not found: " << source.string();
    throw SourceNotFound(source.string());
  }

  file.open(source, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Digest engine: Failed to open: " << source.string();
    throw IoError("Failed to open " + source.string());
  }
}

std::size_t DigestEngine::read_block(std::istream& input, char* buffer,
                                     const std::string& source_name) const {
  input.read(buffer, static_cast<std::streamsize>(BLOCK_SIZE));
  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Digest engine: Read failure on: " << source_name;
    throw IoError("Failed to read " + source_name);
  }
  return static_cast<std::size_t>(input.gcount());
}

} // namespace blobpipe::digest
