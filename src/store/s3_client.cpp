#include "store/s3_client.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <sstream>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <openssl/ssl.h>

namespace hvault {
namespace store {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* USER_AGENT = "honeyvault/1.0";
constexpr const char* SERVICE = "s3";

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string to_string(beast::string_view value) {
  return std::string(value.data(), value.size());
}

std::string env_or_empty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

// One HTTP request/response exchange driven to completion on a private
// io_context. Every step is bounded by the timeout through tcp_stream.
template <typename Stream, bool Tls>
class Exchange {
public:
  Exchange(Stream& stream, http::request<http::string_body>& request,
           std::chrono::seconds timeout, bool head_request)
    : stream_(stream)
    , request_(request)
    , timeout_(timeout) {
    // HEAD responses advertise a Content-Length but carry no body
    parser_.skip(head_request);
  }

  void start(const tcp::resolver::results_type& endpoints) {
    stage_ = "connect";
    lowest().expires_after(timeout_);
    lowest().async_connect(endpoints,
      [this](beast::error_code ec, const tcp::endpoint&) { on_connect(ec); });
  }

  const beast::error_code& error() const { return error_; }
  const char* stage() const { return stage_; }
  http::response<http::string_body> release() { return parser_.release(); }

private:
  Stream& stream_;
  http::request<http::string_body>& request_;
  std::chrono::seconds timeout_;
  beast::flat_buffer buffer_;
  http::response_parser<http::string_body> parser_;
  beast::error_code error_;
  const char* stage_{"idle"};

  beast::tcp_stream& lowest() { return beast::get_lowest_layer(stream_); }

  void on_connect(beast::error_code ec) {
    if (ec) {
      return fail(ec);
    }
    if constexpr (Tls) {
      stage_ = "handshake";
      lowest().expires_after(timeout_);
      stream_.async_handshake(ssl::stream_base::client,
        [this](beast::error_code ec) { on_handshake(ec); });
    } else {
      send();
    }
  }

  void on_handshake(beast::error_code ec) {
    if (ec) {
      return fail(ec);
    }
    send();
  }

  void send() {
    stage_ = "write";
    lowest().expires_after(timeout_);
    http::async_write(stream_, request_,
      [this](beast::error_code ec, std::size_t) { on_write(ec); });
  }

  void on_write(beast::error_code ec) {
    if (ec) {
      return fail(ec);
    }
    stage_ = "read";
    lowest().expires_after(timeout_);
    http::async_read(stream_, buffer_, parser_,
      [this](beast::error_code ec, std::size_t) { on_read(ec); });
  }

  void on_read(beast::error_code ec) {
    if (ec) {
      return fail(ec);
    }
    stage_ = "done";
  }

  void fail(beast::error_code ec) {
    error_ = ec;
  }
};

template <bool Tls, typename Stream>
http::response<http::string_body> run_exchange(asio::io_context& ioc, Stream& stream,
                                               http::request<http::string_body>& request,
                                               const tcp::resolver::results_type& endpoints,
                                               std::chrono::seconds timeout,
                                               const std::string& host) {
  Exchange<Stream, Tls> exchange(stream, request, timeout, request.method() == http::verb::head);
  exchange.start(endpoints);
  ioc.run();

  if (exchange.error()) {
    BOOST_LOG_TRIVIAL(error) << "S3: " << exchange.stage() << " failed for " << host
                             << ": " << exchange.error().message();
    throw ObjectStoreError(0, "NetworkError",
      std::string("S3: ") + exchange.stage() + " failed for " + host + ": " + exchange.error().message());
  }
  return exchange.release();
}

} // namespace


//==============================================
// ENDPOINT AND CREDENTIAL RESOLUTION
//==============================================

Endpoint parse_endpoint(const config::StoreConfig& config) {
  Endpoint endpoint;

  if (!config.endpoint) {
    endpoint.tls = true;
    endpoint.host = "s3." + config.region + ".amazonaws.com";
    endpoint.port = "443";
    endpoint.path_style = false;
    return endpoint;
  }

  const std::string& url = *config.endpoint;
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    throw config::ConfigError("S3: Endpoint must start with http:// or https://: " + url);
  }

  const std::string scheme = lowercase(url.substr(0, scheme_end));
  if (scheme == "https") {
    endpoint.tls = true;
  } else if (scheme == "http") {
    endpoint.tls = false;
  } else {
    throw config::ConfigError("S3: Unsupported endpoint scheme: " + scheme);
  }

  std::string authority = url.substr(scheme_end + 3);
  while (!authority.empty() && authority.back() == '/') {
    authority.pop_back();
  }
  if (authority.empty() || authority.find('/') != std::string::npos) {
    throw config::ConfigError("S3: Endpoint must be scheme://host[:port]: " + url);
  }

  std::string port;
  if (authority.front() == '[') {
    // IPv6 literal, brackets stay part of the host name
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      throw config::ConfigError("S3: Malformed IPv6 endpoint: " + url);
    }
    endpoint.host = authority.substr(0, close + 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        throw config::ConfigError("S3: Malformed IPv6 endpoint: " + url);
      }
      port = authority.substr(close + 2);
    }
  } else {
    const auto colon = authority.rfind(':');
    endpoint.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port = authority.substr(colon + 1);
    }
  }

  if (port.empty()) {
    port = endpoint.tls ? "443" : "80";
  } else if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw config::ConfigError("S3: Invalid endpoint port: " + port);
  }

  endpoint.port = port;
  endpoint.path_style = true;
  return endpoint;
}

aws::Credentials resolve_credentials(const config::StoreConfig& config) {
  aws::Credentials credentials;

  if (config.has_static_credentials()) {
    credentials.access_key_id = config.access_key_id;
    credentials.secret_access_key = config.secret_access_key;
    return credentials;
  }

  credentials.access_key_id = env_or_empty("AWS_ACCESS_KEY_ID");
  credentials.secret_access_key = env_or_empty("AWS_SECRET_ACCESS_KEY");
  credentials.session_token = env_or_empty("AWS_SESSION_TOKEN");
  if (!credentials) {
    return aws::Credentials{};
  }
  return credentials;
}


//==============================================
// CONSTRUCTOR
//==============================================

S3Client::S3Client(const config::StoreConfig& config)
  : config_(config)
  , endpoint_(parse_endpoint(config))
  , credentials_(resolve_credentials(config))
  , ssl_context_(ssl::context::tls_client) {

  if (config_.verify) {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(ssl::verify_peer);
  } else {
    BOOST_LOG_TRIVIAL(warning) << "S3: TLS certificate verification is disabled";
    ssl_context_.set_verify_mode(ssl::verify_none);
  }

  if (!credentials_) {
    BOOST_LOG_TRIVIAL(warning) << "S3: No credentials available, requests will be sent unsigned";
  }

  BOOST_LOG_TRIVIAL(info) << "S3: Client for " << (endpoint_.tls ? "https://" : "http://")
                          << endpoint_.host << ":" << endpoint_.port
                          << " (region " << config_.region << ", "
                          << (endpoint_.path_style ? "path-style" : "virtual-hosted") << " addressing)";
}


//==============================================
// OBJECT OPERATIONS
//==============================================

ObjectStat S3Client::head_object(const std::string& bucket, const std::string& key) {
  BOOST_LOG_TRIVIAL(trace) << "S3: HEAD " << bucket << "/" << key;

  const RequestTarget target = resolve_target(bucket, key);
  Request request = make_request(http::verb::head, target, std::string());
  Response response = perform(request, target);

  if (response.result() != http::status::ok) {
    raise_for_status(response, "HEAD", key);
  }

  ObjectStat stat;
  auto length = response.find(http::field::content_length);
  if (length != response.end()) {
    try {
      stat.size = std::stoull(to_string(length->value()));
    } catch (const std::exception&) {
      BOOST_LOG_TRIVIAL(warning) << "S3: Ignoring malformed Content-Length for " << key;
    }
  }
  auto etag = response.find(http::field::etag);
  if (etag != response.end()) {
    stat.etag = to_string(etag->value());
  }
  return stat;
}

void S3Client::put_object(const std::string& bucket, const std::string& key,
                          const std::string& body, const std::string& content_type) {
  BOOST_LOG_TRIVIAL(trace) << "S3: PUT " << bucket << "/" << key << " (" << body.size() << " bytes)";

  const RequestTarget target = resolve_target(bucket, key);
  Request request = make_request(http::verb::put, target, body);
  request.set(http::field::content_type, content_type);
  Response response = perform(request, target);

  if (response.result_int() / 100 != 2) {
    raise_for_status(response, "PUT", key);
  }
}

RequestTarget S3Client::resolve_target(const std::string& bucket, const std::string& key) const {
  RequestTarget target;
  const std::string encoded_key = aws::uri_encode(key, false);

  // Dotted bucket names do not match the wildcard certificate of virtual hosts
  if (endpoint_.path_style || bucket.find('.') != std::string::npos) {
    target.connect_host = endpoint_.host;
    target.target = "/" + aws::uri_encode(bucket, true) + "/" + encoded_key;
  } else {
    target.connect_host = bucket + "." + endpoint_.host;
    target.target = "/" + encoded_key;
  }

  target.host = target.connect_host;
  if (endpoint_.port != (endpoint_.tls ? "443" : "80")) {
    target.host += ":" + endpoint_.port;
  }
  return target;
}


//==============================================
// REQUEST PROCESSING
//==============================================

S3Client::Request S3Client::make_request(http::verb method, const RequestTarget& target,
                                         std::string body) {
  Request request{method, target.target, 11};
  request.set(http::field::host, target.host);
  request.set(http::field::user_agent, USER_AGENT);

  const std::string payload_hash = crypto::sha256_hex(body);
  request.body() = std::move(body);
  sign(request, target, payload_hash);
  if (method != http::verb::head) {
    request.prepare_payload();
  }
  return request;
}

void S3Client::sign(Request& request, const RequestTarget& target,
                    const std::string& payload_hash) const {
  const std::string amz_date = aws::format_amz_date(std::chrono::system_clock::now());
  request.set("x-amz-date", amz_date);
  request.set("x-amz-content-sha256", payload_hash);
  if (!credentials_.session_token.empty()) {
    request.set("x-amz-security-token", credentials_.session_token);
  }

  if (!credentials_) {
    return;
  }

  aws::SignableRequest signable;
  signable.method = to_string(request.method_string());
  signable.canonical_uri = target.target;
  signable.payload_hash = payload_hash;
  signable.headers["host"] = target.host;
  signable.headers["x-amz-content-sha256"] = payload_hash;
  signable.headers["x-amz-date"] = amz_date;
  if (!credentials_.session_token.empty()) {
    signable.headers["x-amz-security-token"] = credentials_.session_token;
  }

  request.set(http::field::authorization,
              aws::authorization_header(signable, credentials_, config_.region, SERVICE, amz_date));
}

S3Client::Response S3Client::perform(Request& request, const RequestTarget& target) {
  asio::io_context ioc;
  tcp::resolver resolver(ioc);

  // IPv6 literals are bracketed in the Host header only
  std::string resolve_host = target.connect_host;
  if (resolve_host.size() > 2 && resolve_host.front() == '[' && resolve_host.back() == ']') {
    resolve_host = resolve_host.substr(1, resolve_host.size() - 2);
  }

  beast::error_code ec;
  auto endpoints = resolver.resolve(resolve_host, endpoint_.port, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "S3: Failed to resolve " << target.connect_host << ": " << ec.message();
    throw ObjectStoreError(0, "NetworkError",
      "S3: Failed to resolve " + target.connect_host + ": " + ec.message());
  }

  const auto timeout = std::chrono::seconds(config_.timeout_seconds);

  if (!endpoint_.tls) {
    beast::tcp_stream stream(ioc);
    return run_exchange<false>(ioc, stream, request, endpoints, timeout, target.connect_host);
  }

  beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_context_);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), target.connect_host.c_str())) {
    throw ObjectStoreError(0, "NetworkError", "S3: Failed to set SNI host name " + target.connect_host);
  }
  if (config_.verify) {
    stream.set_verify_callback(ssl::host_name_verification(target.connect_host));
  }
  return run_exchange<true>(ioc, stream, request, endpoints, timeout, target.connect_host);
}

void S3Client::raise_for_status(const Response& response, const std::string& operation,
                                const std::string& key) const {
  const unsigned status = response.result_int();
  std::string code;
  std::string message;

  // HEAD carries no body; other failures return an S3 <Error> document
  if (!response.body().empty()) {
    try {
      std::istringstream input(response.body());
      boost::property_tree::ptree tree;
      boost::property_tree::read_xml(input, tree);
      code = tree.get<std::string>("Error.Code", "");
      message = tree.get<std::string>("Error.Message", "");
    } catch (const boost::property_tree::xml_parser_error& e) {
      BOOST_LOG_TRIVIAL(debug) << "S3: Unparseable error body for " << key << ": " << e.what();
    }
  }

  if (code.empty()) {
    code = status == 404 ? "NotFound" : std::to_string(status);
  }
  if (message.empty()) {
    message = to_string(response.reason());
  }

  if (status != 404) {
    BOOST_LOG_TRIVIAL(error) << "S3: " << operation << " " << key << " failed with "
                             << status << " " << code << ": " << message;
  }
  throw ObjectStoreError(status, code,
    "S3: " + operation + " " + key + " failed (" + std::to_string(status) + " " + code + "): " + message);
}

} // namespace store
} // namespace hvault
