#include <gtest/gtest.h>
#include <cstdlib>
#include "config/store_config.hpp"
#include "storage/local_object_store.hpp"
#include "storage/s3_object_store.hpp"
#include "test_utils.hpp"

using namespace blobpipe;
using namespace blobpipe::config;

class StoreConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
    clear_environment();
  }

  void TearDown() override {
    clear_environment();
  }

  static void clear_environment() {
    for (const char* name : {"BLOBPIPE_ENDPOINT", "BLOBPIPE_REGION", "BLOBPIPE_ACCESS_KEY_ID",
                             "BLOBPIPE_SECRET_ACCESS_KEY", "BLOBPIPE_TIMEOUT_SECONDS"}) {
      unsetenv(name);
    }
  }
};

TEST_F(StoreConfigTest, ParsesHttpEndpointWithPort) {
  const auto endpoint = parse_endpoint("http://localhost:9000");

  EXPECT_EQ(endpoint.scheme, "http");
  EXPECT_EQ(endpoint.host, "localhost");
  EXPECT_EQ(endpoint.port, 9000);
  EXPECT_FALSE(endpoint.secure());
  EXPECT_EQ(endpoint.host_header(), "localhost:9000");
}

TEST_F(StoreConfigTest, HttpsEndpointDefaultsToPort443) {
  const auto endpoint = parse_endpoint("HTTPS://account.r2.cloudflarestorage.com/ignored/path");

  EXPECT_EQ(endpoint.scheme, "https");
  EXPECT_EQ(endpoint.host, "account.r2.cloudflarestorage.com");
  EXPECT_EQ(endpoint.port, 443);
  EXPECT_TRUE(endpoint.secure());
  EXPECT_EQ(endpoint.host_header(), "account.r2.cloudflarestorage.com");
}

TEST_F(StoreConfigTest, FileEndpointCarriesDirectory) {
  const auto endpoint = parse_endpoint("file:///var/lib/blobpipe");
  EXPECT_TRUE(endpoint.local());
  EXPECT_EQ(endpoint.base_path, "/var/lib/blobpipe");
}

TEST_F(StoreConfigTest, RejectsMalformedEndpoints) {
  EXPECT_THROW(parse_endpoint("localhost:9000"), ConfigError);
  EXPECT_THROW(parse_endpoint("ftp://host"), ConfigError);
  EXPECT_THROW(parse_endpoint("http://:9000"), ConfigError);
  EXPECT_THROW(parse_endpoint("http://host:port"), ConfigError);
  EXPECT_THROW(parse_endpoint("http://host:70000"), ConfigError);
  EXPECT_THROW(parse_endpoint("file://"), ConfigError);
}

TEST_F(StoreConfigTest, ReadsEnvironment) {
  setenv("BLOBPIPE_ENDPOINT", "https://s3.example.com", 1);
  setenv("BLOBPIPE_REGION", "eu-west-1", 1);
  setenv("BLOBPIPE_ACCESS_KEY_ID", "AKID", 1);
  setenv("BLOBPIPE_SECRET_ACCESS_KEY", "secret", 1);
  setenv("BLOBPIPE_TIMEOUT_SECONDS", "12", 1);

  const auto config = StoreConfig::from_environment();

  EXPECT_EQ(config.endpoint_url, "https://s3.example.com");
  EXPECT_EQ(config.region, "eu-west-1");
  EXPECT_EQ(config.access_key_id, "AKID");
  EXPECT_EQ(config.secret_access_key, "secret");
  EXPECT_EQ(config.timeout, std::chrono::seconds(12));
  EXPECT_NO_THROW(config.validate());
}

TEST_F(StoreConfigTest, EnvironmentDefaults) {
  const auto config = StoreConfig::from_environment();
  EXPECT_EQ(config.region, "auto");
  EXPECT_EQ(config.timeout, std::chrono::seconds(30));
  EXPECT_THROW(config.validate(), ConfigError);
}

TEST_F(StoreConfigTest, InvalidTimeoutIsRejected) {
  setenv("BLOBPIPE_TIMEOUT_SECONDS", "soon", 1);
  EXPECT_THROW(StoreConfig::from_environment(), ConfigError);
}

TEST_F(StoreConfigTest, RemoteEndpointNeedsCredentials) {
  StoreConfig config;
  config.endpoint_url = "http://localhost:9000";
  EXPECT_THROW(config.validate(), ConfigError);

  config.access_key_id = "AKID";
  config.secret_access_key = "secret";
  EXPECT_NO_THROW(config.validate());

  config.timeout = std::chrono::seconds(0);
  EXPECT_THROW(config.validate(), ConfigError);
}

TEST_F(StoreConfigTest, FactoryPicksBackendFromScheme) {
  TempDir dir("store_factory");

  StoreConfig local;
  local.endpoint_url = "file://" + dir.path().string();
  auto local_store = storage::make_object_store(local);
  EXPECT_NE(dynamic_cast<storage::LocalObjectStore*>(local_store.get()), nullptr);

  StoreConfig remote;
  remote.endpoint_url = "http://127.0.0.1:9000";
  remote.access_key_id = "AKID";
  remote.secret_access_key = "secret";
  auto remote_store = storage::make_object_store(remote);
  EXPECT_NE(dynamic_cast<storage::S3ObjectStore*>(remote_store.get()), nullptr);
}
