#ifndef BLOBPIPE_TRANSFER_POLICY_HPP
#define BLOBPIPE_TRANSFER_POLICY_HPP

#include <cstdint>
#include <variant>
#include <vector>

namespace blobpipe::transfer {

constexpr std::uint64_t DEFAULT_MULTIPART_THRESHOLD = 100ULL * 1024 * 1024;
constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 100ULL * 1024 * 1024;

struct TransferConfig {
  // Size at or above which a transfer is split into parts
  std::uint64_t multipart_threshold = DEFAULT_MULTIPART_THRESHOLD;
  std::uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
  std::uint32_t max_concurrency = 4;
  bool use_parallelism = true;
};

// 2x the available cores, never less than 4. A core count of 0 means unknown.
std::uint32_t default_max_concurrency(unsigned int available_cores);

// Default configuration for a machine with the given number of cores
TransferConfig make_default_config(unsigned int available_cores);


struct SinglePart {};

struct Multipart {
  std::uint64_t chunk_size;
  std::uint32_t concurrency;
};

using TransferPlan = std::variant<SinglePart, Multipart>;

// Chooses single-shot or multipart transfer. Performs no I/O.
TransferPlan decide(std::uint64_t file_size, const TransferConfig& config);


struct PartRange {
  int part_number;        // 1-based, as the wire protocol numbers parts
  std::uint64_t offset;
  std::uint64_t length;
};

// Splits an object into consecutive parts of chunk_size bytes (the last may be
// shorter). A zero-byte object yields a single empty part.
std::vector<PartRange> plan_parts(std::uint64_t file_size, std::uint64_t chunk_size);

} // namespace blobpipe::transfer

#endif // BLOBPIPE_TRANSFER_POLICY_HPP
