#pragma once

#include <chrono>
#include <map>
#include <string>

namespace hvault {
namespace store {
namespace aws {

struct Credentials {
  std::string access_key_id;
  std::string secret_access_key;
  std::string session_token;

  explicit operator bool() const {
    return !access_key_id.empty() && !secret_access_key.empty();
  }
};

// Request fields covered by an AWS Signature Version 4 signature.
// Header names must be lowercase; every header in the map is signed.
struct SignableRequest {
  std::string method;
  std::string canonical_uri;
  std::string canonical_query;
  std::map<std::string, std::string> headers;
  std::string payload_hash;
};

// "20130524T000000Z" form used by x-amz-date
std::string format_amz_date(std::chrono::system_clock::time_point when);

// Percent-encodes everything except unreserved characters; '/' is kept when
// encode_slash is false, as required for S3 object paths.
std::string uri_encode(const std::string& value, bool encode_slash);

std::string canonical_request(const SignableRequest& request);
std::string signed_headers(const SignableRequest& request);

// Computes the value of the Authorization header. amz_date must match the
// request's x-amz-date header.
std::string authorization_header(const SignableRequest& request, const Credentials& credentials,
                                 const std::string& region, const std::string& service,
                                 const std::string& amz_date);

} // namespace aws
} // namespace store
} // namespace hvault
