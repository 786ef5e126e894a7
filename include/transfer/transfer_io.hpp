#ifndef BLOBPIPE_TRANSFER_IO_HPP
#define BLOBPIPE_TRANSFER_IO_HPP

#include <cstdint>
#include <filesystem>
#include <string>

namespace blobpipe::transfer {

// Local file access shared by the transfer clients. Every call opens its own
// handle so concurrent parts never share stream state. Failures throw IoError.

// Size of a regular file. Throws SourceNotFound when it does not exist.
std::uint64_t source_size(const std::filesystem::path& source);

std::string read_range(const std::filesystem::path& source, std::uint64_t offset, std::uint64_t length);

// Creates the missing parent directories of destination
void ensure_parent_directory(const std::filesystem::path& destination);

// Replaces destination with a file of exactly size bytes, ready for write_range
void preallocate(const std::filesystem::path& destination, std::uint64_t size);

void write_range(const std::filesystem::path& destination, std::uint64_t offset, const std::string& data);

// Truncates destination and writes data as its whole content
void write_file(const std::filesystem::path& destination, const std::string& data);

} // namespace blobpipe::transfer

#endif // BLOBPIPE_TRANSFER_IO_HPP
