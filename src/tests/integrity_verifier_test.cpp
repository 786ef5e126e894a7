#include <gtest/gtest.h>
#include <filesystem>
#include <boost/asio/io_context.hpp>
#include "common/coroutine_context.hpp"
#include "common/error.hpp"
#include "integrity/integrity_verifier.hpp"
#include "test_utils.hpp"

using namespace blobpipe;
using namespace blobpipe::integrity;

namespace {
const std::string ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const std::string ABC_SHA1 = "a9993e364706816aba3e25717850c26c9cd0d89d";
const std::string ABC_MD5 = "900150983cd24fb0d6963f7d28e17f72";
}

class IntegrityVerifierTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> dir;
  std::filesystem::path file;
  IntegrityVerifier verifier;

  void SetUp() override {
    init_logging();
    dir = std::make_unique<TempDir>("integrity_test");
    file = *dir / "abc.txt";
    write_test_file(file, "abc");
  }
};

TEST_F(IntegrityVerifierTest, MatchingDigestReturnsResult) {
  const auto result = verifier.verify(file, ABC_SHA256);

  EXPECT_EQ(result.size, 3u);
  EXPECT_EQ(result.sha256, ABC_SHA256);
  EXPECT_EQ(result.md5, ABC_MD5);
}

TEST_F(IntegrityVerifierTest, ComparisonIgnoresCase) {
  std::string upper = ABC_SHA256;
  for (auto& c : upper) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  EXPECT_NO_THROW(verifier.verify(file, upper));
}

TEST_F(IntegrityVerifierTest, OtherAlgorithms) {
  EXPECT_NO_THROW(verifier.verify(file, ABC_SHA1, digest::Algorithm::Sha1));
  EXPECT_NO_THROW(verifier.verify(file, ABC_MD5, digest::Algorithm::Md5));
  EXPECT_THROW(verifier.verify(file, ABC_SHA256, digest::Algorithm::Sha1), ChecksumMismatch);
}

TEST_F(IntegrityVerifierTest, MismatchReportsBothDigestsAndKeepsFile) {
  const std::string expected(64, '0');
  try {
    verifier.verify(file, expected);
    FAIL() << "Expected ChecksumMismatch";
  } catch (const ChecksumMismatch& e) {
    EXPECT_EQ(e.algorithm(), "sha256");
    EXPECT_EQ(e.path(), file.string());
    EXPECT_EQ(e.expected(), expected);
    EXPECT_EQ(e.actual(), ABC_SHA256);
  }
  // The file stays for inspection
  EXPECT_EQ(read_test_file(file), "abc");
}

TEST_F(IntegrityVerifierTest, MissingFile) {
  EXPECT_THROW(verifier.verify(*dir / "missing", ABC_SHA256), SourceNotFound);
}

TEST_F(IntegrityVerifierTest, CooperativeVerification) {
  boost::asio::io_context io_context;

  const auto result = run_coroutine(io_context, [&](CoroutineContext context) {
    return verifier.async_verify(file, ABC_SHA1, digest::Algorithm::Sha1, context);
  });
  EXPECT_EQ(result.sha256, ABC_SHA256);

  EXPECT_THROW(run_coroutine(io_context, [&](CoroutineContext context) {
                 return verifier.async_verify(file, ABC_MD5, digest::Algorithm::Sha256, context);
               }),
               ChecksumMismatch);
  EXPECT_EQ(read_test_file(file), "abc");
}

TEST(IntegrityVerifierMatchTest, Matches) {
  EXPECT_TRUE(IntegrityVerifier::matches("abcdef", "ABCDEF"));
  EXPECT_FALSE(IntegrityVerifier::matches("abcdef", "abcde"));
  EXPECT_FALSE(IntegrityVerifier::matches("", "abcdef"));
}
