#include "storage/s3_object_store.hpp"
#include <algorithm>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <utility>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

namespace blobpipe::storage {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
namespace pt = boost::property_tree;
using tcp = boost::asio::ip::tcp;

namespace {

const char* USER_AGENT = "blobpipe/1.0";

// Runs a cooperative operation to completion on a private io_context
template <typename Operation>
auto run_blocking(Operation&& operation) {
  net::io_context io_context;
  return run_coroutine(io_context, std::forward<Operation>(operation));
}

std::string range_header(const ByteRange& range) {
  return "bytes=" + std::to_string(range.offset) + "-"
    + std::to_string(range.offset + range.length - 1);
}

std::string field_value(const http::response<http::string_body>& message, http::field field) {
  const auto value = message[field];
  return std::string(value.data(), value.size());
}

// Returns the root element of an XML document, or an empty tree when the body is not XML
pt::ptree parse_xml(const std::string& body) {
  pt::ptree tree;
  if (body.empty()) {
    return tree;
  }
  try {
    std::istringstream input(body);
    pt::read_xml(input, tree, pt::xml_parser::trim_whitespace);
  } catch (const pt::ptree_error& e) {
    BOOST_LOG_TRIVIAL(debug) << "S3 store: Response body is not XML: " << e.what();
    return pt::ptree();
  }
  return tree;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

S3ObjectStore::S3ObjectStore(const config::StoreConfig& config)
  : endpoint_(config::parse_endpoint(config.endpoint_url))
  , timeout_(config.timeout)
  , signer_(config.access_key_id, config.secret_access_key, config.region)
  , ssl_context_(net::ssl::context::tls_client) {

  if (endpoint_.local()) {
    throw config::ConfigError("S3 store: Endpoint must use http or https: " + config.endpoint_url);
  }
  ssl_context_.set_default_verify_paths();
  ssl_context_.set_verify_mode(net::ssl::verify_peer);

  BOOST_LOG_TRIVIAL(debug) << "S3 store: Initialized for " << endpoint_.host_header()
                           << " region " << config.region;
}

//==============================================
// SINGLE-SHOT OPERATIONS
//==============================================

std::string S3ObjectStore::put_object(const std::string& bucket, const std::string& key,
                                      const std::string& body, const std::string& content_type) {
  return run_blocking([&](CoroutineContext context) {
    return async_put_object(bucket, key, body, content_type, context);
  });
}

std::string S3ObjectStore::get_object(const std::string& bucket, const std::string& key,
                                      const std::optional<ByteRange>& range) {
  return run_blocking([&](CoroutineContext context) {
    return async_get_object(bucket, key, range, context);
  });
}

std::optional<ObjectInfo> S3ObjectStore::head_object(const std::string& bucket, const std::string& key) {
  return run_blocking([&](CoroutineContext context) {
    return async_head_object(bucket, key, context);
  });
}

void S3ObjectStore::delete_object(const std::string& bucket, const std::string& key) {
  run_blocking([&](CoroutineContext context) {
    async_delete_object(bucket, key, context);
  });
}

//==============================================
// MULTIPART UPLOAD
//==============================================

std::string S3ObjectStore::create_multipart_upload(const std::string& bucket, const std::string& key,
                                                   const std::string& content_type) {
  return run_blocking([&](CoroutineContext context) {
    return async_create_multipart_upload(bucket, key, content_type, context);
  });
}

std::string S3ObjectStore::upload_part(const std::string& bucket, const std::string& key,
                                       const std::string& upload_id, int part_number,
                                       const std::string& body) {
  return run_blocking([&](CoroutineContext context) {
    return async_upload_part(bucket, key, upload_id, part_number, body, context);
  });
}

void S3ObjectStore::complete_multipart_upload(const std::string& bucket, const std::string& key,
                                              const std::string& upload_id,
                                              const std::vector<CompletedPart>& parts) {
  run_blocking([&](CoroutineContext context) {
    async_complete_multipart_upload(bucket, key, upload_id, parts, context);
  });
}

void S3ObjectStore::abort_multipart_upload(const std::string& bucket, const std::string& key,
                                           const std::string& upload_id) {
  run_blocking([&](CoroutineContext context) {
    async_abort_multipart_upload(bucket, key, upload_id, context);
  });
}

//==============================================
// COOPERATIVE OPERATIONS
//==============================================

std::string S3ObjectStore::async_put_object(const std::string& bucket, const std::string& key,
                                            const std::string& body, const std::string& content_type,
                                            CoroutineContext context) {
  Request request{http::verb::put, bucket, key, {}, body, content_type, std::nullopt};
  const Response response = perform(request, context);
  if (response.status != 200) {
    fail("PutObject", key, response);
  }
  return response.etag;
}

std::string S3ObjectStore::async_get_object(const std::string& bucket, const std::string& key,
                                            const std::optional<ByteRange>& range,
                                            CoroutineContext context) {
  // A zero-length range cannot be expressed as a Range header
  if (range && range->length == 0) {
    return "";
  }

  Request request{http::verb::get, bucket, key, {}, "", "", range};
  Response response = perform(request, context);
  if (response.status == 404) {
    throw ObjectNotFound(key);
  }
  if (response.status != 200 && response.status != 206) {
    fail("GetObject", key, response);
  }
  return std::move(response.body);
}

std::optional<ObjectInfo> S3ObjectStore::async_head_object(const std::string& bucket, const std::string& key,
                                                           CoroutineContext context) {
  Request request{http::verb::head, bucket, key, {}, "", "", std::nullopt};
  const Response response = perform(request, context);
  if (response.status == 404) {
    return std::nullopt;
  }
  if (response.status != 200) {
    fail("HeadObject", key, response);
  }
  return ObjectInfo{response.content_length, response.etag, response.content_type};
}

void S3ObjectStore::async_delete_object(const std::string& bucket, const std::string& key,
                                        CoroutineContext context) {
  Request request{http::verb::delete_, bucket, key, {}, "", "", std::nullopt};
  const Response response = perform(request, context);
  if (response.status != 204 && response.status != 200 && response.status != 404) {
    fail("DeleteObject", key, response);
  }
}

std::string S3ObjectStore::async_create_multipart_upload(const std::string& bucket, const std::string& key,
                                                         const std::string& content_type,
                                                         CoroutineContext context) {
  Request request{http::verb::post, bucket, key, {{"uploads", ""}}, "", content_type, std::nullopt};
  const Response response = perform(request, context);
  if (response.status != 200) {
    fail("CreateMultipartUpload", key, response);
  }

  const pt::ptree document = parse_xml(response.body);
  const std::string upload_id = document.get<std::string>("InitiateMultipartUploadResult.UploadId", "");
  if (upload_id.empty()) {
    throw StorageError("S3 store: CreateMultipartUpload for '" + key + "' returned no upload id",
                       response.status);
  }
  BOOST_LOG_TRIVIAL(debug) << "S3 store: Started multipart upload " << upload_id << " for " << key;
  return upload_id;
}

std::string S3ObjectStore::async_upload_part(const std::string& bucket, const std::string& key,
                                             const std::string& upload_id, int part_number,
                                             const std::string& body, CoroutineContext context) {
  Request request{http::verb::put, bucket, key,
                  {{"partNumber", std::to_string(part_number)}, {"uploadId", upload_id}},
                  body, "", std::nullopt};
  const Response response = perform(request, context);
  if (response.status != 200) {
    fail("UploadPart", key, response);
  }
  if (response.etag.empty()) {
    throw StorageError("S3 store: UploadPart " + std::to_string(part_number) + " for '" + key
                       + "' returned no ETag", response.status);
  }
  return response.etag;
}

void S3ObjectStore::async_complete_multipart_upload(const std::string& bucket, const std::string& key,
                                                    const std::string& upload_id,
                                                    const std::vector<CompletedPart>& parts,
                                                    CoroutineContext context) {
  pt::ptree document;
  for (const auto& part : parts) {
    pt::ptree node;
    node.put("PartNumber", part.part_number);
    node.put("ETag", part.etag);
    document.add_child("CompleteMultipartUpload.Part", node);
  }
  std::ostringstream body;
  pt::write_xml(body, document);

  Request request{http::verb::post, bucket, key, {{"uploadId", upload_id}},
                  body.str(), "application/xml", std::nullopt};
  const Response response = perform(request, context);
  if (response.status != 200) {
    fail("CompleteMultipartUpload", key, response);
  }
  // Completion failures can arrive as an error document with status 200
  if (parse_xml(response.body).get_child_optional("Error")) {
    fail("CompleteMultipartUpload", key, response);
  }
}

void S3ObjectStore::async_abort_multipart_upload(const std::string& bucket, const std::string& key,
                                                 const std::string& upload_id, CoroutineContext context) {
  Request request{http::verb::delete_, bucket, key, {{"uploadId", upload_id}}, "", "", std::nullopt};
  const Response response = perform(request, context);
  if (response.status != 204 && response.status != 200) {
    fail("AbortMultipartUpload", key, response);
  }
}

//==============================================
// HTTP EXCHANGE
//==============================================

S3ObjectStore::Response S3ObjectStore::perform(const Request& request, CoroutineContext context) {
  beast::error_code ec;

  tcp::resolver resolver(context.io_context);
  const auto results = resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
                                              context.yield[ec]);
  if (ec) {
    throw StorageError("S3 store: Failed to resolve " + endpoint_.host + ": " + ec.message());
  }

  if (!endpoint_.secure()) {
    beast::tcp_stream stream(context.io_context);
    stream.expires_after(timeout_);
    stream.async_connect(results, context.yield[ec]);
    if (ec) {
      throw StorageError("S3 store: Failed to connect to " + endpoint_.host_header() + ": " + ec.message());
    }

    Response response = exchange(stream, request, context);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "S3 store: Socket shutdown reported: " << ec.message();
    }
    return response;
  }

  beast::ssl_stream<beast::tcp_stream> stream(context.io_context, ssl_context_);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
    throw StorageError("S3 store: Failed to set TLS server name for " + endpoint_.host);
  }

  beast::get_lowest_layer(stream).expires_after(timeout_);
  beast::get_lowest_layer(stream).async_connect(results, context.yield[ec]);
  if (ec) {
    throw StorageError("S3 store: Failed to connect to " + endpoint_.host_header() + ": " + ec.message());
  }
  stream.async_handshake(net::ssl::stream_base::client, context.yield[ec]);
  if (ec) {
    throw StorageError("S3 store: TLS handshake with " + endpoint_.host + " failed: " + ec.message());
  }

  Response response = exchange(stream, request, context);

  beast::get_lowest_layer(stream).expires_after(timeout_);
  stream.async_shutdown(context.yield[ec]);
  if (ec && ec != net::error::eof && ec != net::ssl::error::stream_truncated) {
    BOOST_LOG_TRIVIAL(debug) << "S3 store: TLS shutdown reported: " << ec.message();
  }
  return response;
}

template <typename Stream>
S3ObjectStore::Response S3ObjectStore::exchange(Stream& stream, const Request& request,
                                                CoroutineContext context) {
  const std::string canonical_uri = "/" + SigV4Signer::uri_encode(request.bucket)
                                  + "/" + SigV4Signer::uri_encode(request.key, false);

  SigningRequest signing;
  const auto verb = http::to_string(request.method);
  signing.method = std::string(verb.data(), verb.size());
  signing.canonical_uri = canonical_uri;
  signing.query = request.query;
  signing.payload_hash = SigV4Signer::sha256_hex(request.body);
  signing.headers["host"] = endpoint_.host_header();
  signing.headers["x-amz-content-sha256"] = signing.payload_hash;
  signing.headers["x-amz-date"] = SigV4Signer::format_amz_date(std::chrono::system_clock::now());
  if (request.range) {
    signing.headers["range"] = range_header(*request.range);
  }

  http::request<http::string_body> message{request.method, target_for(request), 11};
  for (const auto& [name, value] : signing.headers) {
    message.set(name, value);
  }
  message.set(http::field::authorization,
              signer_.authorization(signing, signing.headers["x-amz-date"]));
  message.set(http::field::user_agent, USER_AGENT);
  if (!request.content_type.empty()) {
    message.set(http::field::content_type, request.content_type);
  }
  message.keep_alive(false);
  message.body() = request.body;
  message.prepare_payload();

  beast::error_code ec;
  beast::get_lowest_layer(stream).expires_after(timeout_);
  http::async_write(stream, message, context.yield[ec]);
  if (ec) {
    throw StorageError("S3 store: Failed to send " + signing.method + " " + request.key + ": " + ec.message());
  }

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
  if (request.method == http::verb::head) {
    parser.skip(true);
  }
  http::async_read(stream, buffer, parser, context.yield[ec]);
  if (ec) {
    throw StorageError("S3 store: Failed to read response to " + signing.method + " " + request.key
                       + ": " + ec.message());
  }

  http::response<http::string_body> reply = parser.release();
  Response response;
  response.status = reply.result_int();
  response.etag = field_value(reply, http::field::etag);
  response.content_type = field_value(reply, http::field::content_type);
  const std::string length = field_value(reply, http::field::content_length);
  if (!length.empty()) {
    response.content_length = std::strtoull(length.c_str(), nullptr, 10);
  }
  response.body = std::move(reply.body());

  BOOST_LOG_TRIVIAL(trace) << "S3 store: " << signing.method << " " << message.target()
                           << " -> " << response.status;
  return response;
}

std::string S3ObjectStore::target_for(const Request& request) const {
  std::string target = "/" + SigV4Signer::uri_encode(request.bucket)
                     + "/" + SigV4Signer::uri_encode(request.key, false);

  std::vector<std::pair<std::string, std::string>> query;
  for (const auto& [name, value] : request.query) {
    query.emplace_back(SigV4Signer::uri_encode(name), SigV4Signer::uri_encode(value));
  }
  std::sort(query.begin(), query.end());

  char separator = '?';
  for (const auto& [name, value] : query) {
    target += separator + name + "=" + value;
    separator = '&';
  }
  return target;
}

void S3ObjectStore::fail(const std::string& operation, const std::string& key,
                         const Response& response) const {
  const pt::ptree document = parse_xml(response.body);
  const std::string code = document.get<std::string>("Error.Code", "");
  const std::string detail = document.get<std::string>("Error.Message", "");

  std::string message = "S3 store: " + operation + " '" + key + "' failed with status "
                      + std::to_string(response.status);
  if (!code.empty()) {
    message += ": " + code;
  }
  if (!detail.empty()) {
    message += " (" + detail + ")";
  }
  BOOST_LOG_TRIVIAL(warning) << message;
  throw StorageError(message, response.status, code);
}

} // namespace blobpipe::storage
