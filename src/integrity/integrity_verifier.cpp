#include "integrity/integrity_verifier.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/log/trivial.hpp>
#include "common/error.hpp"

namespace blobpipe::integrity {

IntegrityVerifier::IntegrityVerifier(const digest::DigestEngine& engine)
  : engine_(engine) {}

digest::DigestResult IntegrityVerifier::verify(const std::filesystem::path& path, const std::string& expected_hex,
                                               digest::Algorithm algorithm) const {
  BOOST_LOG_TRIVIAL(debug) << "Integrity: Verifying " << digest::to_string(algorithm) << " of " << path;

  digest::DigestResult result = engine_.compute(path);
  check(path, expected_hex, algorithm, result);
  return result;
}

digest::DigestResult IntegrityVerifier::async_verify(const std::filesystem::path& path,
                                                     const std::string& expected_hex, digest::Algorithm algorithm,
                                                     CoroutineContext context) const {
  BOOST_LOG_TRIVIAL(debug) << "Integrity: Verifying " << digest::to_string(algorithm) << " of " << path
                           << " cooperatively";

  digest::DigestResult result = engine_.async_compute(path, context);
  check(path, expected_hex, algorithm, result);
  return result;
}

void IntegrityVerifier::check(const std::filesystem::path& path, const std::string& expected_hex,
                              digest::Algorithm algorithm, const digest::DigestResult& result) const {
  const std::string& actual = result.hex(algorithm);
  if (!matches(expected_hex, actual)) {
    BOOST_LOG_TRIVIAL(error) << "Integrity: " << digest::to_string(algorithm) << " mismatch for " << path
                             << " (expected " << expected_hex << ", got " << actual << ")";
    throw ChecksumMismatch(digest::to_string(algorithm), path.string(), expected_hex, actual);
  }
  BOOST_LOG_TRIVIAL(info) << "Integrity: " << path << " verified";
}

bool IntegrityVerifier::matches(const std::string& expected_hex, const std::string& actual_hex) {
  return boost::algorithm::iequals(expected_hex, actual_hex);
}

} // namespace blobpipe::integrity
