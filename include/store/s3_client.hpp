#ifndef HVAULT_STORE_S3_CLIENT_HPP
#define HVAULT_STORE_S3_CLIENT_HPP

#include <string>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>
#include "config/config.hpp"
#include "store/aws_sigv4.hpp"
#include "store/object_store.hpp"

namespace hvault {
namespace store {

// Parsed form of the configured (or default AWS) endpoint
struct Endpoint {
  bool tls{true};
  std::string host;
  std::string port;
  // Bucket in the path (custom endpoints) or in the host name (AWS)
  bool path_style{false};
};

// Where a request for a bucket/key goes
struct RequestTarget {
  std::string host;         // value of the Host header
  std::string connect_host;
  std::string target;       // encoded request path
};

Endpoint parse_endpoint(const config::StoreConfig& config);

// Static credentials from config, else the AWS_* environment variables.
// Returns empty credentials when neither is set.
aws::Credentials resolve_credentials(const config::StoreConfig& config);

// Amazon S3 (or compatible) REST client over Boost.Beast. Every call opens its
// own connection and blocks the calling thread until the response arrives or
// the configured timeout expires.
class S3Client : public ObjectStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit S3Client(const config::StoreConfig& config);
  ~S3Client() override = default;


  // ---- OBJECT OPERATIONS ----
  ObjectStat head_object(const std::string& bucket, const std::string& key) override;
  void put_object(const std::string& bucket, const std::string& key,
                  const std::string& body, const std::string& content_type) override;


  // ---- GETTERS ----
  const Endpoint& endpoint() const { return endpoint_; }
  RequestTarget resolve_target(const std::string& bucket, const std::string& key) const;

private:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  // ---- PARAMETERS ----
  config::StoreConfig config_;
  Endpoint endpoint_;
  aws::Credentials credentials_;
  boost::asio::ssl::context ssl_context_;


  // ---- REQUEST PROCESSING ----
  // Builds a signed request for the given target
  Request make_request(boost::beast::http::verb method, const RequestTarget& target,
                       std::string body);
  // Adds x-amz-* headers and, when credentials are present, the Authorization header
  void sign(Request& request, const RequestTarget& target, const std::string& payload_hash) const;
  // Sends the request and reads the full response
  Response perform(Request& request, const RequestTarget& target);
  // Converts a non-2xx response into an ObjectStoreError
  [[noreturn]] void raise_for_status(const Response& response, const std::string& operation,
                                     const std::string& key) const;
};

} // namespace store
} // namespace hvault

#endif // HVAULT_STORE_S3_CLIENT_HPP
