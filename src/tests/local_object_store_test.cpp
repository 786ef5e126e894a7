#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "storage/local_object_store.hpp"
#include "storage/sigv4_signer.hpp"
#include "test_utils.hpp"

using namespace blobpipe::storage;

class LocalObjectStoreTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> dir;
  std::unique_ptr<LocalObjectStore> store;

  void SetUp() override {
    init_logging();
    dir = std::make_unique<TempDir>("local_store_test");
    store = std::make_unique<LocalObjectStore>(dir->path());
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    if (store) {
      store->clear();
      store.reset();
    }
    dir.reset();
  }

  // Helper methods to reduce repetition
  void put_and_verify(const std::string& key, const std::string& data) {
    ASSERT_NO_THROW(store->put_object("bucket", key, data, "application/octet-stream"))
      << "Failed to store key: " << key;
    auto info = store->head_object("bucket", key);
    ASSERT_TRUE(info.has_value()) << "Key should exist after storing: " << key;
    EXPECT_EQ(info->size, data.size());
    ASSERT_EQ(store->get_object("bucket", key, std::nullopt), data) << "Data mismatch for key: " << key;
  }

  void expect_retrieval_fails(const std::string& key) {
    EXPECT_FALSE(store->head_object("bucket", key).has_value()) << "Key should not exist: " << key;
    EXPECT_THROW(store->get_object("bucket", key, std::nullopt), ObjectNotFound)
      << "Getting non-existent key should throw: " << key;
  }
};

TEST_F(LocalObjectStoreTest, BasicOperations) {
  put_and_verify("releases/v1/app.zip", "Hello, Store!");
  put_and_verify("releases/v1/empty.bin", "");
  expect_retrieval_fails("releases/v1/missing.bin");
}

TEST_F(LocalObjectStoreTest, MetadataIsKept) {
  const std::string etag = store->put_object("bucket", "docs/v1/readme.txt", "abc", "text/plain");

  // Quoted MD5 of "abc"
  EXPECT_EQ(etag, "\"900150983cd24fb0d6963f7d28e17f72\"");
  const auto info = store->head_object("bucket", "docs/v1/readme.txt");
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->content_type, "text/plain");
  EXPECT_EQ(info->etag, etag);
}

TEST_F(LocalObjectStoreTest, ObjectsLiveAtShardedKeyHashPath) {
  store->put_object("bucket", "cas/v1/blob", "content", "");

  const std::string hash = SigV4Signer::sha256_hex("cas/v1/blob");
  const auto expected = dir->path() / "bucket" / hash.substr(0, 2) / hash.substr(2, 2) / hash.substr(4, 2)
                      / hash.substr(6);
  ASSERT_TRUE(std::filesystem::exists(expected)) << expected;
  EXPECT_EQ(read_test_file(expected), "content");
}

TEST_F(LocalObjectStoreTest, BucketsAreSeparate) {
  store->put_object("first", "same/v1/key", "one", "");
  store->put_object("second", "same/v1/key", "two", "");

  EXPECT_EQ(store->get_object("first", "same/v1/key", std::nullopt), "one");
  EXPECT_EQ(store->get_object("second", "same/v1/key", std::nullopt), "two");
}

TEST_F(LocalObjectStoreTest, RangedReads) {
  store->put_object("bucket", "range/v1/data", "0123456789", "");

  EXPECT_EQ(store->get_object("bucket", "range/v1/data", ByteRange{2, 3}), "234");
  // A range running past the end is truncated
  EXPECT_EQ(store->get_object("bucket", "range/v1/data", ByteRange{8, 10}), "89");
  EXPECT_EQ(store->get_object("bucket", "range/v1/data", ByteRange{10, 0}), "");

  try {
    store->get_object("bucket", "range/v1/data", ByteRange{10, 1});
    FAIL() << "Expected StorageError";
  } catch (const StorageError& e) {
    EXPECT_EQ(e.status(), 416u);
    EXPECT_EQ(e.code(), "InvalidRange");
  }
}

TEST_F(LocalObjectStoreTest, DeleteIsIdempotent) {
  put_and_verify("tmp/v1/file", "temp");
  ASSERT_NO_THROW(store->delete_object("bucket", "tmp/v1/file"));
  expect_retrieval_fails("tmp/v1/file");
  EXPECT_NO_THROW(store->delete_object("bucket", "tmp/v1/file"));
}

TEST_F(LocalObjectStoreTest, RejectsInvalidBucketNames) {
  EXPECT_THROW(store->put_object("", "k/v/f", "x", ""), StorageError);
  EXPECT_THROW(store->put_object(".multipart", "k/v/f", "x", ""), StorageError);
}

TEST_F(LocalObjectStoreTest, MultipartUploadAssemblesPartsInOrder) {
  const std::string key = "big/v1/archive.tar";
  const std::string upload_id = store->create_multipart_upload("bucket", key, "application/x-tar");
  EXPECT_EQ(store->pending_uploads(), 1u);

  // Parts arrive out of order
  const std::string etag2 = store->upload_part("bucket", key, upload_id, 2, "world");
  const std::string etag1 = store->upload_part("bucket", key, upload_id, 1, "hello ");
  store->complete_multipart_upload("bucket", key, upload_id, {{1, etag1}, {2, etag2}});

  EXPECT_EQ(store->get_object("bucket", key, std::nullopt), "hello world");
  EXPECT_EQ(store->pending_uploads(), 0u);

  const auto info = store->head_object("bucket", key);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->content_type, "application/x-tar");
  EXPECT_NE(info->etag.find("-2\""), std::string::npos) << info->etag;
}

TEST_F(LocalObjectStoreTest, MultipartCompletionValidatesParts) {
  const std::string key = "big/v1/file";
  const std::string upload_id = store->create_multipart_upload("bucket", key, "");
  const std::string etag1 = store->upload_part("bucket", key, upload_id, 1, "a");
  const std::string etag2 = store->upload_part("bucket", key, upload_id, 2, "b");

  EXPECT_THROW(store->complete_multipart_upload("bucket", key, upload_id, {}), StorageError);
  EXPECT_THROW(store->complete_multipart_upload("bucket", key, upload_id, {{2, etag2}, {1, etag1}}),
               StorageError);
  EXPECT_THROW(store->complete_multipart_upload("bucket", key, upload_id, {{1, etag2}, {2, etag2}}),
               StorageError);
  EXPECT_THROW(store->complete_multipart_upload("bucket", key, upload_id, {{1, etag1}, {3, etag2}}),
               StorageError);
  EXPECT_THROW(store->complete_multipart_upload("bucket", "other/v1/key", upload_id, {{1, etag1}}),
               StorageError);

  // Still pending after failed attempts
  EXPECT_EQ(store->pending_uploads(), 1u);
  expect_retrieval_fails(key);
}

TEST_F(LocalObjectStoreTest, AbortDiscardsParts) {
  const std::string key = "big/v1/aborted";
  const std::string upload_id = store->create_multipart_upload("bucket", key, "");
  store->upload_part("bucket", key, upload_id, 1, "data");

  store->abort_multipart_upload("bucket", key, upload_id);

  EXPECT_EQ(store->pending_uploads(), 0u);
  expect_retrieval_fails(key);
  try {
    store->upload_part("bucket", key, upload_id, 2, "late");
    FAIL() << "Expected StorageError";
  } catch (const StorageError& e) {
    EXPECT_EQ(e.code(), "NoSuchUpload");
  }
}

TEST_F(LocalObjectStoreTest, ConcurrentPartUploads) {
  const std::string key = "parallel/v1/file";
  const std::string upload_id = store->create_multipart_upload("bucket", key, "");

  constexpr int PARTS = 8;
  std::vector<std::string> etags(PARTS);
  std::vector<std::thread> threads;
  for (int i = 0; i < PARTS; ++i) {
    threads.emplace_back([&, i] {
      etags[i] = store->upload_part("bucket", key, upload_id, i + 1, std::string(1000, static_cast<char>('a' + i)));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::vector<CompletedPart> parts;
  std::string expected;
  for (int i = 0; i < PARTS; ++i) {
    parts.push_back({i + 1, etags[i]});
    expected += std::string(1000, static_cast<char>('a' + i));
  }
  store->complete_multipart_upload("bucket", key, upload_id, parts);

  EXPECT_EQ(store->get_object("bucket", key, std::nullopt), expected);
}

TEST_F(LocalObjectStoreTest, ClearRemovesEverything) {
  put_and_verify("a/v1/b", "data");
  store->create_multipart_upload("bucket", "c/v1/d", "");

  ASSERT_NO_THROW(store->clear());

  expect_retrieval_fails("a/v1/b");
  EXPECT_EQ(store->pending_uploads(), 0u);
}
