#include "transfer/transfer_policy.hpp"
#include <algorithm>
#include <stdexcept>

namespace blobpipe::transfer {

std::uint32_t default_max_concurrency(unsigned int available_cores) {
  const unsigned int cores = available_cores == 0 ? 2 : available_cores;
  return std::max<std::uint32_t>(4, cores * 2);
}

TransferConfig make_default_config(unsigned int available_cores) {
  TransferConfig config;
  config.max_concurrency = default_max_concurrency(available_cores);
  return config;
}

TransferPlan decide(std::uint64_t file_size, const TransferConfig& config) {
  if (file_size < config.multipart_threshold) {
    return SinglePart{};
  }

  if (config.chunk_size == 0) {
    throw std::invalid_argument("Transfer policy: chunk_size must be > 0");
  }

  std::uint32_t concurrency = std::max<std::uint32_t>(1, config.max_concurrency);
  if (!config.use_parallelism) {
    concurrency = 1;
  }
  return Multipart{config.chunk_size, concurrency};
}

std::vector<PartRange> plan_parts(std::uint64_t file_size, std::uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("Transfer policy: chunk_size must be > 0");
  }

  std::vector<PartRange> parts;
  if (file_size == 0) {
    parts.push_back(PartRange{1, 0, 0});
    return parts;
  }

  parts.reserve(static_cast<std::size_t>((file_size + chunk_size - 1) / chunk_size));
  int part_number = 1;
  for (std::uint64_t offset = 0; offset < file_size; offset += chunk_size) {
    parts.push_back(PartRange{part_number++, offset, std::min(chunk_size, file_size - offset)});
  }
  return parts;
}

} // namespace blobpipe::transfer
