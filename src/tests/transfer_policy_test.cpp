#include <gtest/gtest.h>
#include <numeric>
#include <stdexcept>
#include "transfer/transfer_policy.hpp"

using namespace blobpipe::transfer;

namespace {

constexpr std::uint64_t MiB = 1024 * 1024;

TransferConfig make_config(std::uint64_t threshold, std::uint64_t chunk, std::uint32_t concurrency,
                           bool parallel = true) {
  TransferConfig config;
  config.multipart_threshold = threshold;
  config.chunk_size = chunk;
  config.max_concurrency = concurrency;
  config.use_parallelism = parallel;
  return config;
}

} // namespace

TEST(TransferPolicyTest, DefaultsAreHundredMebibytes) {
  const TransferConfig config;
  EXPECT_EQ(config.multipart_threshold, 100 * MiB);
  EXPECT_EQ(config.chunk_size, 100 * MiB);
  EXPECT_TRUE(config.use_parallelism);
}

TEST(TransferPolicyTest, DefaultConcurrencyIsTwiceCoresWithFloorOfFour) {
  EXPECT_EQ(default_max_concurrency(1), 4u);
  EXPECT_EQ(default_max_concurrency(2), 4u);
  EXPECT_EQ(default_max_concurrency(3), 6u);
  EXPECT_EQ(default_max_concurrency(16), 32u);
  // Unknown core count counts as two cores
  EXPECT_EQ(default_max_concurrency(0), 4u);
  EXPECT_EQ(make_default_config(8).max_concurrency, 16u);
}

TEST(TransferPolicyTest, SmallFileIsSinglePart) {
  const auto plan = decide(50 * MiB, TransferConfig{});
  EXPECT_TRUE(std::holds_alternative<SinglePart>(plan));
}

TEST(TransferPolicyTest, FileAtThresholdIsMultipart) {
  const auto plan = decide(100 * MiB, make_config(100 * MiB, 8 * MiB, 6));

  ASSERT_TRUE(std::holds_alternative<Multipart>(plan));
  EXPECT_EQ(std::get<Multipart>(plan).chunk_size, 8 * MiB);
  EXPECT_EQ(std::get<Multipart>(plan).concurrency, 6u);
}

TEST(TransferPolicyTest, ZeroThresholdAlwaysSelectsMultipart) {
  EXPECT_TRUE(std::holds_alternative<Multipart>(decide(0, make_config(0, 1024, 4))));
  EXPECT_TRUE(std::holds_alternative<Multipart>(decide(1, make_config(0, 1024, 4))));
}

TEST(TransferPolicyTest, ThresholdAboveSizeAlwaysSelectsSinglePart) {
  EXPECT_TRUE(std::holds_alternative<SinglePart>(decide(0, make_config(1, 1024, 4))));
  EXPECT_TRUE(std::holds_alternative<SinglePart>(decide(999, make_config(1000, 1024, 4))));
}

TEST(TransferPolicyTest, ConcurrencyIsAtLeastOne) {
  const auto plan = decide(10, make_config(0, 4, 0));
  ASSERT_TRUE(std::holds_alternative<Multipart>(plan));
  EXPECT_EQ(std::get<Multipart>(plan).concurrency, 1u);
}

TEST(TransferPolicyTest, DisabledParallelismForcesSingleWorker) {
  const auto plan = decide(10, make_config(0, 4, 16, false));
  ASSERT_TRUE(std::holds_alternative<Multipart>(plan));
  EXPECT_EQ(std::get<Multipart>(plan).concurrency, 1u);
}

TEST(TransferPolicyTest, ZeroChunkSizeIsRejectedForMultipart) {
  EXPECT_THROW(decide(10, make_config(0, 0, 4)), std::invalid_argument);
  // Single-part plans never look at the chunk size
  EXPECT_NO_THROW(decide(10, make_config(100, 0, 4)));
}

TEST(TransferPolicyTest, PlanPartsCoversFileExactly) {
  const auto parts = plan_parts(10, 4);

  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0].part_number, 1);
  EXPECT_EQ(parts[0].offset, 0u);
  EXPECT_EQ(parts[0].length, 4u);
  EXPECT_EQ(parts[1].offset, 4u);
  EXPECT_EQ(parts[2].part_number, 3);
  EXPECT_EQ(parts[2].offset, 8u);
  EXPECT_EQ(parts[2].length, 2u);

  const auto total = std::accumulate(parts.begin(), parts.end(), std::uint64_t{0},
                                     [](std::uint64_t sum, const PartRange& part) { return sum + part.length; });
  EXPECT_EQ(total, 10u);
}

TEST(TransferPolicyTest, PlanPartsExactMultiple) {
  const auto parts = plan_parts(12, 4);
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts.back().length, 4u);
}

TEST(TransferPolicyTest, EmptyObjectHasOneEmptyPart) {
  const auto parts = plan_parts(0, 4);
  ASSERT_EQ(parts.size(), 1u);
  EXPECT_EQ(parts[0].part_number, 1);
  EXPECT_EQ(parts[0].length, 0u);
}

TEST(TransferPolicyTest, PlanPartsRejectsZeroChunk) {
  EXPECT_THROW(plan_parts(10, 0), std::invalid_argument);
}
