#pragma once

#include <cstdint>
#include <functional>
#include <mutex>

namespace blobpipe {
namespace transfer {

// Receives the cumulative number of bytes transferred so far
using ProgressObserver = std::function<void(std::uint64_t)>;

// Turns per-chunk byte deltas into a monotone running total. One instance is
// owned by exactly one transfer call.
class ProgressAggregator {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ProgressAggregator(ProgressObserver observer);

  ProgressAggregator(const ProgressAggregator&) = delete;
  ProgressAggregator& operator=(const ProgressAggregator&) = delete;


  // ---- PROGRESS REPORTING ----
  // Adds delta to the total and forwards the new total to the observer.
  // Safe to call from several transfer workers at once.
  void report(std::uint64_t delta);


  // ---- GETTERS ----
  std::uint64_t bytes_transferred() const;

private:
  // ---- PARAMETERS ----
  ProgressObserver observer_;
  mutable std::mutex mutex_;
  std::uint64_t bytes_transferred_{0};
};

} // namespace transfer
} // namespace blobpipe
