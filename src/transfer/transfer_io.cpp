#include "transfer/transfer_io.hpp"
#include <fstream>
#include <system_error>
#include "common/error.hpp"

namespace blobpipe::transfer {

namespace fs = std::filesystem;

std::uint64_t source_size(const fs::path& source) {
  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    throw SourceNotFound(source.string());
  }
  const auto size = fs::file_size(source, ec);
  if (ec) {
    throw IoError("Failed to stat " + source.string() + ": " + ec.message());
  }
  return size;
}

std::string read_range(const fs::path& source, std::uint64_t offset, std::uint64_t length) {
  std::ifstream file(source, std::ios::binary);
  if (!file) {
    throw IoError("Failed to open " + source.string());
  }

  std::string data(length, '\0');
  if (length == 0) {
    return data;
  }

  file.seekg(static_cast<std::streamoff>(offset));
  file.read(data.data(), static_cast<std::streamsize>(length));
  if (static_cast<std::uint64_t>(file.gcount()) != length) {
    throw IoError("Short read from " + source.string() + " at offset " + std::to_string(offset));
  }
  return data;
}

void ensure_parent_directory(const fs::path& destination) {
  const fs::path parent = destination.parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    throw IoError("Failed to create directory " + parent.string() + ": " + ec.message());
  }
}

void preallocate(const fs::path& destination, std::uint64_t size) {
  {
    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw IoError("Failed to create " + destination.string());
    }
  }
  std::error_code ec;
  fs::resize_file(destination, size, ec);
  if (ec) {
    throw IoError("Failed to size " + destination.string() + ": " + ec.message());
  }
}

void write_range(const fs::path& destination, std::uint64_t offset, const std::string& data) {
  std::fstream file(destination, std::ios::binary | std::ios::in | std::ios::out);
  if (!file) {
    throw IoError("Failed to open " + destination.string());
  }
  file.seekp(static_cast<std::streamoff>(offset));
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  file.flush();
  if (!file) {
    throw IoError("Failed to write " + destination.string() + " at offset " + std::to_string(offset));
  }
}

void write_file(const fs::path& destination, const std::string& data) {
  std::ofstream file(destination, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw IoError("Failed to create " + destination.string());
  }
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  file.flush();
  if (!file) {
    throw IoError("Failed to write " + destination.string());
  }
}

} // namespace blobpipe::transfer
