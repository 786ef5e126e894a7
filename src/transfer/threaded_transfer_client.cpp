#include "transfer/threaded_transfer_client.hpp"
#include <algorithm>
#include <exception>
#include <mutex>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>
#include "common/error.hpp"
#include "transfer/transfer_io.hpp"

namespace blobpipe::transfer {

namespace fs = std::filesystem;

namespace {

// One thread per part at most; a pool of zero threads would never run anything
std::size_t pool_size(std::uint32_t concurrency, std::size_t part_count) {
  return std::max<std::size_t>(std::min<std::size_t>(concurrency, part_count), 1);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ThreadedTransferClient::ThreadedTransferClient(storage::ObjectStore& store, TransferConfig default_config)
  : store_(store)
  , default_config_(default_config) {
  BOOST_LOG_TRIVIAL(debug) << "Threaded transfer: Initialized with max concurrency "
                           << default_config_.max_concurrency;
}

//==============================================
// TRANSFERS
//==============================================

std::string ThreadedTransferClient::upload(const fs::path& source, const storage::ObjectLocation& location,
                                           const UploadOptions& options) {
  const std::string key = location.object_key();
  const std::uint64_t size = source_size(source);
  const TransferConfig config = options.config.value_or(default_config_);
  const std::string content_type = options.content_type.value_or("");
  ProgressAggregator progress(options.observer);

  BOOST_LOG_TRIVIAL(info) << "Threaded transfer: Uploading " << source << " (" << size
                          << " bytes) to " << location.bucket << "/" << key;
  try {
    const TransferPlan plan = decide(size, config);
    if (const auto* multipart = std::get_if<Multipart>(&plan)) {
      upload_parts(source, location.bucket, key, content_type, size, *multipart, progress);
    } else {
      store_.put_object(location.bucket, key, read_range(source, 0, size), content_type);
      progress.report(size);
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Threaded transfer: Upload of " << key << " failed: " << e.what();
    throw UploadFailure(key, e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Threaded transfer: Uploaded " << key;
  return key;
}

void ThreadedTransferClient::upload_bytes(const std::string& data, const std::string& bucket,
                                          const std::string& key, const std::string& content_type) {
  try {
    store_.put_object(bucket, key, data, content_type);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Threaded transfer: Upload of " << key << " failed: " << e.what();
    throw UploadFailure(key, e.what());
  }
  BOOST_LOG_TRIVIAL(debug) << "Threaded transfer: Uploaded " << data.size() << " bytes to " << key;
}

fs::path ThreadedTransferClient::download(const storage::ObjectLocation& location, const fs::path& destination,
                                          const DownloadOptions& options) {
  const std::string key = location.object_key();
  const TransferConfig config = options.config.value_or(default_config_);
  ProgressAggregator progress(options.observer);

  BOOST_LOG_TRIVIAL(info) << "Threaded transfer: Downloading " << location.bucket << "/" << key
                          << " to " << destination;
  try {
    ensure_parent_directory(destination);

    const auto info = store_.head_object(location.bucket, key);
    if (!info) {
      throw storage::ObjectNotFound(key);
    }

    const TransferPlan plan = decide(info->size, config);
    if (const auto* multipart = std::get_if<Multipart>(&plan)) {
      download_parts(location.bucket, key, destination, info->size, *multipart, progress);
    } else {
      const std::string body = store_.get_object(location.bucket, key, std::nullopt);
      write_file(destination, body);
      progress.report(body.size());
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Threaded transfer: Download of " << key << " failed: " << e.what();
    throw DownloadFailure(key, e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Threaded transfer: Downloaded " << key << " (" << progress.bytes_transferred()
                          << " bytes)";
  return destination;
}

//==============================================
// OBJECT MANAGEMENT
//==============================================

bool ThreadedTransferClient::exists(const std::string& bucket, const std::string& key) {
  try {
    return store_.head_object(bucket, key).has_value();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Threaded transfer: Existence check of " << key << " failed: " << e.what();
    throw UploadFailure(key, e.what());
  }
}

void ThreadedTransferClient::remove(const std::string& bucket, const std::string& key) {
  try {
    store_.delete_object(bucket, key);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Threaded transfer: Removal of " << key << " failed: " << e.what();
    throw UploadFailure(key, e.what());
  }
  BOOST_LOG_TRIVIAL(info) << "Threaded transfer: Removed " << bucket << "/" << key;
}

//==============================================
// MULTIPART
//==============================================

void ThreadedTransferClient::upload_parts(const fs::path& source, const std::string& bucket,
                                          const std::string& key, const std::string& content_type,
                                          std::uint64_t size, const Multipart& plan,
                                          ProgressAggregator& progress) {
  const std::vector<PartRange> parts = plan_parts(size, plan.chunk_size);
  const std::string upload_id = store_.create_multipart_upload(bucket, key, content_type);
  BOOST_LOG_TRIVIAL(debug) << "Threaded transfer: Multipart upload " << upload_id << " with "
                           << parts.size() << " parts, concurrency " << plan.concurrency;

  std::vector<storage::CompletedPart> completed(parts.size());
  std::mutex failure_mutex;
  std::exception_ptr failure;

  {
    boost::asio::thread_pool pool(pool_size(plan.concurrency, parts.size()));
    for (std::size_t i = 0; i < parts.size(); ++i) {
      boost::asio::post(pool, [&, i] {
        {
          std::lock_guard<std::mutex> lock(failure_mutex);
          if (failure) {
            return;
          }
        }
        try {
          const PartRange& part = parts[i];
          const std::string body = read_range(source, part.offset, part.length);
          std::string etag = store_.upload_part(bucket, key, upload_id, part.part_number, body);
          completed[i] = storage::CompletedPart{part.part_number, std::move(etag)};
          progress.report(part.length);
        } catch (const std::exception&) {
          std::lock_guard<std::mutex> lock(failure_mutex);
          if (!failure) {
            failure = std::current_exception();
          }
        }
      });
    }
    pool.join();
  }

  if (!failure) {
    try {
      store_.complete_multipart_upload(bucket, key, upload_id, completed);
    } catch (const std::exception&) {
      failure = std::current_exception();
    }
  }

  if (failure) {
    abort_upload(bucket, key, upload_id);
    std::rethrow_exception(failure);
  }
}

void ThreadedTransferClient::download_parts(const std::string& bucket, const std::string& key,
                                            const fs::path& destination, std::uint64_t size,
                                            const Multipart& plan, ProgressAggregator& progress) {
  const std::vector<PartRange> parts = plan_parts(size, plan.chunk_size);
  preallocate(destination, size);
  BOOST_LOG_TRIVIAL(debug) << "Threaded transfer: Ranged download of " << key << " in "
                           << parts.size() << " parts, concurrency " << plan.concurrency;

  std::mutex failure_mutex;
  std::exception_ptr failure;

  {
    boost::asio::thread_pool pool(pool_size(plan.concurrency, parts.size()));
    for (const PartRange& part : parts) {
      boost::asio::post(pool, [&, part] {
        {
          std::lock_guard<std::mutex> lock(failure_mutex);
          if (failure) {
            return;
          }
        }
        try {
          if (part.length > 0) {
            const std::string body = store_.get_object(bucket, key,
                                                       storage::ByteRange{part.offset, part.length});
            if (body.size() != part.length) {
              throw IoError("Part " + std::to_string(part.part_number) + " of " + key + " returned "
                            + std::to_string(body.size()) + " bytes, expected "
                            + std::to_string(part.length));
            }
            write_range(destination, part.offset, body);
          }
          progress.report(part.length);
        } catch (const std::exception&) {
          std::lock_guard<std::mutex> lock(failure_mutex);
          if (!failure) {
            failure = std::current_exception();
          }
        }
      });
    }
    pool.join();
  }

  if (failure) {
    std::rethrow_exception(failure);
  }
}

void ThreadedTransferClient::abort_upload(const std::string& bucket, const std::string& key,
                                          const std::string& upload_id) {
  try {
    store_.abort_multipart_upload(bucket, key, upload_id);
    BOOST_LOG_TRIVIAL(info) << "Threaded transfer: Aborted multipart upload " << upload_id;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Threaded transfer: Failed to abort multipart upload " << upload_id
                               << ": " << e.what();
  }
}

} // namespace blobpipe::transfer
