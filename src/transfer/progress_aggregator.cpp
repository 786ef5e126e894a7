#include "transfer/progress_aggregator.hpp"
#include <boost/log/trivial.hpp>

namespace blobpipe {
namespace transfer {

ProgressAggregator::ProgressAggregator(ProgressObserver observer)
  : observer_(std::move(observer)) {}

void ProgressAggregator::report(std::uint64_t delta) {
  // The observer runs under the lock so totals reach it in increasing order
  std::lock_guard<std::mutex> lock(mutex_);
  bytes_transferred_ += delta;
  BOOST_LOG_TRIVIAL(trace) << "Progress: +" << delta << " bytes, total " << bytes_transferred_;

  if (observer_) {
    observer_(bytes_transferred_);
  }
}

std::uint64_t ProgressAggregator::bytes_transferred() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_transferred_;
}

} // namespace transfer
} // namespace blobpipe
