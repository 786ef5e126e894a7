#ifndef BLOBPIPE_DIGEST_ENGINE_HPP
#define BLOBPIPE_DIGEST_ENGINE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include "common/coroutine_context.hpp"
#include "common/error.hpp"
#include "digest/digest_result.hpp"

namespace blobpipe::digest {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Four running digest accumulators fed from the same bytes
class MultiDigest {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MultiDigest();
  ~MultiDigest();

  MultiDigest(const MultiDigest&) = delete;
  MultiDigest& operator=(const MultiDigest&) = delete;


  // ---- ACCUMULATION ----
  // Feeds a block into every accumulator and advances the byte counter
  void update(const char* data, std::size_t length);
  // Produces the result; the accumulator cannot be updated afterwards
  DigestResult finalize();


  // ---- GETTERS ----
  std::uint64_t size() const { return size_; }

private:
  // ---- PARAMETERS ----
  std::array<std::unique_ptr<DigestContext>, 4> contexts_;
  std::uint64_t size_ = 0;
  bool finalized_ = false;
};


class DigestEngine {
public:
  static constexpr std::size_t BLOCK_SIZE = 64 * 1024;

  // ---- BLOCKING DIGEST ----
  // Digests a local file; throws SourceNotFound if it does not exist
  DigestResult compute(const std::filesystem::path& source) const;
  // Digests the remaining bytes of a stream
  DigestResult compute(std::istream& input) const;


  // ---- COOPERATIVE DIGEST ----
  // Same output as compute(), yielding to the io_context after every block
  DigestResult async_compute(const std::filesystem::path& source, CoroutineContext context) const;

private:
  // Reads the next block, returns the number of bytes read (0 at end of stream)
  std::size_t read_block(std::istream& input, char* buffer, const std::string& source_name) const;
  void open_source(const std::filesystem::path& source, std::ifstream& file) const;
};

} // namespace blobpipe::digest

#endif // BLOBPIPE_DIGEST_ENGINE_HPP
