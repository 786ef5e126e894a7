#include "transfer/cooperative_transfer_client.hpp"
#include <algorithm>
#include <exception>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/log/trivial.hpp>
#include "common/error.hpp"
#include "transfer/transfer_io.hpp"

namespace blobpipe::transfer {

namespace fs = std::filesystem;

namespace {

// Runs work(index, worker_context) for every index in [0, task_count) on at
// most concurrency coroutines and suspends the caller until all of them are
// done. The first exception stops the hand-out of further tasks and is
// rethrown once the running tasks have finished.
template <typename Work>
void run_workers(CoroutineContext context, std::size_t task_count, std::uint32_t concurrency, Work work) {
  std::size_t next = 0;
  std::size_t live = 0;
  std::exception_ptr failure;

  boost::asio::steady_timer done(context.io_context);
  done.expires_at(boost::asio::steady_timer::time_point::max());

  const std::size_t workers = std::min<std::size_t>(std::max<std::uint32_t>(concurrency, 1), task_count);
  for (std::size_t w = 0; w < workers; ++w) {
    ++live;
    boost::asio::spawn(context.yield, [&](boost::asio::yield_context yield) {
      const CoroutineContext worker{context.io_context, yield};
      while (!failure && next < task_count) {
        const std::size_t index = next++;
        try {
          work(index, worker);
        } catch (const std::exception&) {
          if (!failure) {
            failure = std::current_exception();
          }
        }
      }
      if (--live == 0) {
        done.cancel();
      }
    });
  }

  // Workers may all have finished inline before the caller gets here
  if (live > 0) {
    boost::system::error_code ec;
    done.async_wait(context.yield[ec]);
  }

  if (failure) {
    std::rethrow_exception(failure);
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CooperativeTransferClient::CooperativeTransferClient(storage::ObjectStore& store, TransferConfig default_config)
  : store_(store)
  , default_config_(default_config) {
  BOOST_LOG_TRIVIAL(debug) << "Cooperative transfer: Initialized with max concurrency "
                           << default_config_.max_concurrency;
}

//==============================================
// TRANSFERS
//==============================================

std::string CooperativeTransferClient::upload(const fs::path& source, const storage::ObjectLocation& location,
                                              const UploadOptions& options) {
  return run_coroutine(io_context_, [&](CoroutineContext context) {
    return async_upload(source, location, options, context);
  });
}

void CooperativeTransferClient::upload_bytes(const std::string& data, const std::string& bucket,
                                             const std::string& key, const std::string& content_type) {
  run_coroutine(io_context_, [&](CoroutineContext context) {
    async_upload_bytes(data, bucket, key, content_type, context);
  });
}

fs::path CooperativeTransferClient::download(const storage::ObjectLocation& location,
                                             const fs::path& destination, const DownloadOptions& options) {
  return run_coroutine(io_context_, [&](CoroutineContext context) {
    return async_download(location, destination, options, context);
  });
}

//==============================================
// OBJECT MANAGEMENT
//==============================================

bool CooperativeTransferClient::exists(const std::string& bucket, const std::string& key) {
  try {
    return run_coroutine(io_context_, [&](CoroutineContext context) {
      return store_.async_head_object(bucket, key, context).has_value();
    });
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Cooperative transfer: Existence check of " << key << " failed: " << e.what();
    throw UploadFailure(key, e.what());
  }
}

void CooperativeTransferClient::remove(const std::string& bucket, const std::string& key) {
  try {
    run_coroutine(io_context_, [&](CoroutineContext context) {
      store_.async_delete_object(bucket, key, context);
    });
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Cooperative transfer: Removal of " << key << " failed: " << e.what();
    throw UploadFailure(key, e.what());
  }
  BOOST_LOG_TRIVIAL(info) << "Cooperative transfer: Removed " << bucket << "/" << key;
}

//==============================================
// COOPERATIVE TRANSFERS
//==============================================

std::string CooperativeTransferClient::async_upload(const fs::path& source, const storage::ObjectLocation& location,
                                                    const UploadOptions& options, CoroutineContext context) {
  const std::string key = location.object_key();
  const std::uint64_t size = source_size(source);
  const TransferConfig config = options.config.value_or(default_config_);
  const std::string content_type = options.content_type.value_or("");
  ProgressAggregator progress(options.observer);

  BOOST_LOG_TRIVIAL(info) << "Cooperative transfer: Uploading " << source << " (" << size
                          << " bytes) to " << location.bucket << "/" << key;
  try {
    const TransferPlan plan = decide(size, config);
    if (const auto* multipart = std::get_if<Multipart>(&plan)) {
      upload_parts(source, location.bucket, key, content_type, size, *multipart, progress, context);
    } else {
      store_.async_put_object(location.bucket, key, read_range(source, 0, size), content_type, context);
      progress.report(size);
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Cooperative transfer: Upload of " << key << " failed: " << e.what();
    throw UploadFailure(key, e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Cooperative transfer: Uploaded " << key;
  return key;
}

void CooperativeTransferClient::async_upload_bytes(const std::string& data, const std::string& bucket,
                                                   const std::string& key, const std::string& content_type,
                                                   CoroutineContext context) {
  try {
    store_.async_put_object(bucket, key, data, content_type, context);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Cooperative transfer: Upload of " << key << " failed: " << e.what();
    throw UploadFailure(key, e.what());
  }
  BOOST_LOG_TRIVIAL(debug) << "Cooperative transfer: Uploaded " << data.size() << " bytes to " << key;
}

fs::path CooperativeTransferClient::async_download(const storage::ObjectLocation& location,
                                                   const fs::path& destination,
                                                   const DownloadOptions& options, CoroutineContext context) {
  const std::string key = location.object_key();
  const TransferConfig config = options.config.value_or(default_config_);
  ProgressAggregator progress(options.observer);

  BOOST_LOG_TRIVIAL(info) << "Cooperative transfer: Downloading " << location.bucket << "/" << key
                          << " to " << destination;
  try {
    ensure_parent_directory(destination);

    const auto info = store_.async_head_object(location.bucket, key, context);
    if (!info) {
      throw storage::ObjectNotFound(key);
    }

    const TransferPlan plan = decide(info->size, config);
    if (const auto* multipart = std::get_if<Multipart>(&plan)) {
      download_parts(location.bucket, key, destination, info->size, *multipart, progress, context);
    } else {
      const std::string body = store_.async_get_object(location.bucket, key, std::nullopt, context);
      write_file(destination, body);
      progress.report(body.size());
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Cooperative transfer: Download of " << key << " failed: " << e.what();
    throw DownloadFailure(key, e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Cooperative transfer: Downloaded " << key << " ("
                          << progress.bytes_transferred() << " bytes)";
  return destination;
}

//==============================================
// MULTIPART
//==============================================

void CooperativeTransferClient::upload_parts(const fs::path& source, const std::string& bucket,
                                             const std::string& key, const std::string& content_type,
                                             std::uint64_t size, const Multipart& plan,
                                             ProgressAggregator& progress, CoroutineContext context) {
  const std::vector<PartRange> parts = plan_parts(size, plan.chunk_size);
  const std::string upload_id = store_.async_create_multipart_upload(bucket, key, content_type, context);
  BOOST_LOG_TRIVIAL(debug) << "Cooperative transfer: Multipart upload " << upload_id << " with "
                           << parts.size() << " parts, concurrency " << plan.concurrency;

  std::vector<storage::CompletedPart> completed(parts.size());
  std::exception_ptr failure;
  try {
    run_workers(context, parts.size(), plan.concurrency, [&](std::size_t i, CoroutineContext worker) {
      const PartRange& part = parts[i];
      const std::string body = read_range(source, part.offset, part.length);
      std::string etag = store_.async_upload_part(bucket, key, upload_id, part.part_number, body, worker);
      completed[i] = storage::CompletedPart{part.part_number, std::move(etag)};
      progress.report(part.length);
    });
    store_.async_complete_multipart_upload(bucket, key, upload_id, completed, context);
  } catch (const std::exception&) {
    failure = std::current_exception();
  }

  // The abort suspends this coroutine, so it must not run inside the handler:
  // coroutines sharing the thread would interleave on its caught-exception stack
  if (failure) {
    abort_upload(bucket, key, upload_id, context);
    std::rethrow_exception(failure);
  }
}

void CooperativeTransferClient::download_parts(const std::string& bucket, const std::string& key,
                                               const fs::path& destination, std::uint64_t size,
                                               const Multipart& plan, ProgressAggregator& progress,
                                               CoroutineContext context) {
  const std::vector<PartRange> parts = plan_parts(size, plan.chunk_size);
  preallocate(destination, size);
  BOOST_LOG_TRIVIAL(debug) << "Cooperative transfer: Ranged download of " << key << " in "
                           << parts.size() << " parts, concurrency " << plan.concurrency;

  run_workers(context, parts.size(), plan.concurrency, [&](std::size_t i, CoroutineContext worker) {
    const PartRange& part = parts[i];
    if (part.length > 0) {
      const std::string body = store_.async_get_object(bucket, key,
                                                       storage::ByteRange{part.offset, part.length}, worker);
      if (body.size() != part.length) {
        throw IoError("Part " + std::to_string(part.part_number) + " of " + key + " returned "
                      + std::to_string(body.size()) + " bytes, expected " + std::to_string(part.length));
      }
      write_range(destination, part.offset, body);
    }
    progress.report(part.length);
  });
}

void CooperativeTransferClient::abort_upload(const std::string& bucket, const std::string& key,
                                             const std::string& upload_id, CoroutineContext context) {
  try {
    store_.async_abort_multipart_upload(bucket, key, upload_id, context);
    BOOST_LOG_TRIVIAL(info) << "Cooperative transfer: Aborted multipart upload " << upload_id;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Cooperative transfer: Failed to abort multipart upload " << upload_id
                               << ": " << e.what();
  }
}

} // namespace blobpipe::transfer
