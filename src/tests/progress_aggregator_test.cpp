#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>
#include "transfer/progress_aggregator.hpp"

using namespace blobpipe::transfer;

TEST(ProgressAggregatorTest, ReportsCumulativeTotals) {
  std::vector<std::uint64_t> seen;
  ProgressAggregator progress([&](std::uint64_t total) { seen.push_back(total); });

  progress.report(10);
  progress.report(0);
  progress.report(5);

  EXPECT_EQ(seen, (std::vector<std::uint64_t>{10, 10, 15}));
  EXPECT_EQ(progress.bytes_transferred(), 15u);
}

TEST(ProgressAggregatorTest, WorksWithoutObserver) {
  ProgressAggregator progress(nullptr);
  progress.report(7);
  progress.report(3);
  EXPECT_EQ(progress.bytes_transferred(), 10u);
}

TEST(ProgressAggregatorTest, ConcurrentReportsSumAndStayMonotone) {
  constexpr int THREADS = 8;
  constexpr int REPORTS_PER_THREAD = 1000;

  std::mutex seen_mutex;
  std::vector<std::uint64_t> seen;
  ProgressAggregator progress([&](std::uint64_t total) {
    std::lock_guard<std::mutex> lock(seen_mutex);
    seen.push_back(total);
  });

  std::vector<std::thread> threads;
  for (int t = 0; t < THREADS; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < REPORTS_PER_THREAD; ++i) {
        progress.report(static_cast<std::uint64_t>(t + 1));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  // 1000 * (1 + 2 + ... + 8)
  const std::uint64_t expected = REPORTS_PER_THREAD * (THREADS * (THREADS + 1) / 2);
  EXPECT_EQ(progress.bytes_transferred(), expected);

  ASSERT_EQ(seen.size(), static_cast<std::size_t>(THREADS * REPORTS_PER_THREAD));
  for (std::size_t i = 1; i < seen.size(); ++i) {
    ASSERT_LE(seen[i - 1], seen[i]) << "Progress went backwards at report " << i;
  }
  EXPECT_EQ(seen.back(), expected);
}
