#ifndef BLOBPIPE_DIGEST_RESULT_HPP
#define BLOBPIPE_DIGEST_RESULT_HPP

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace blobpipe::digest {

enum class Algorithm {
  Md5,
  Sha1,
  Sha256,
  Sha512
};

// Order in which sidecars are written and digests are reported
constexpr std::array<Algorithm, 4> ALL_ALGORITHMS = {
  Algorithm::Md5, Algorithm::Sha1, Algorithm::Sha256, Algorithm::Sha512
};

// Lowercase name, also used as the sidecar key extension
const char* to_string(Algorithm algorithm);

struct DigestResult {
  std::uint64_t size = 0;
  std::string md5;
  std::string sha1;
  std::string sha256;
  std::string sha512;

  // Hex digest for the given algorithm
  const std::string& hex(Algorithm algorithm) const;

  bool operator==(const DigestResult& other) const {
    return size == other.size && md5 == other.md5 && sha1 == other.sha1
        && sha256 == other.sha256 && sha512 == other.sha512;
  }
  bool operator!=(const DigestResult& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const DigestResult& result);

} // namespace blobpipe::digest

#endif // BLOBPIPE_DIGEST_RESULT_HPP
