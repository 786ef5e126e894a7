#ifndef BLOBPIPE_INTEGRITY_VERIFIER_HPP
#define BLOBPIPE_INTEGRITY_VERIFIER_HPP

#include <filesystem>
#include <string>
#include "digest/digest_engine.hpp"

namespace blobpipe::integrity {

// Recomputes the digest of a local file and compares it with an expected hex
// value, ignoring case. Throws ChecksumMismatch on disagreement; the file is
// left in place either way.
class IntegrityVerifier {
public:
  explicit IntegrityVerifier(const digest::DigestEngine& engine = digest::DigestEngine());

  // Returns the digest that was computed
  digest::DigestResult verify(const std::filesystem::path& path, const std::string& expected_hex,
                              digest::Algorithm algorithm = digest::Algorithm::Sha256) const;
  // Same check, digesting cooperatively on context
  digest::DigestResult async_verify(const std::filesystem::path& path, const std::string& expected_hex,
                                    digest::Algorithm algorithm, CoroutineContext context) const;

  // True when the two hex strings denote the same digest
  static bool matches(const std::string& expected_hex, const std::string& actual_hex);

private:
  digest::DigestEngine engine_;

  void check(const std::filesystem::path& path, const std::string& expected_hex, digest::Algorithm algorithm,
             const digest::DigestResult& result) const;
};

} // namespace blobpipe::integrity

#endif // BLOBPIPE_INTEGRITY_VERIFIER_HPP
