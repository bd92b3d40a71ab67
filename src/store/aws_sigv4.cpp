#include "store/aws_sigv4.hpp"
#include "crypto/digest.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hvault {
namespace store {
namespace aws {

namespace {

constexpr const char* ALGORITHM = "AWS4-HMAC-SHA256";

crypto::Bytes to_bytes(const std::string& value) {
  return crypto::Bytes(value.begin(), value.end());
}

std::string trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

} // namespace

std::string format_amz_date(std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
  return ss.str();
}

std::string uri_encode(const std::string& value, bool encode_slash) {
  std::ostringstream ss;
  ss << std::uppercase << std::hex << std::setfill('0');
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
        (c == '/' && !encode_slash)) {
      ss << c;
    } else {
      ss << '%' << std::setw(2) << static_cast<int>(c);
    }
  }
  return ss.str();
}

std::string signed_headers(const SignableRequest& request) {
  std::string list;
  for (const auto& [name, value] : request.headers) {
    if (!list.empty()) {
      list += ';';
    }
    list += name;
  }
  return list;
}

std::string canonical_request(const SignableRequest& request) {
  std::ostringstream ss;
  ss << request.method << '\n'
     << request.canonical_uri << '\n'
     << request.canonical_query << '\n';
  for (const auto& [name, value] : request.headers) {
    ss << name << ':' << trim(value) << '\n';
  }
  ss << '\n'
     << signed_headers(request) << '\n'
     << request.payload_hash;
  return ss.str();
}

std::string authorization_header(const SignableRequest& request, const Credentials& credentials,
                                 const std::string& region, const std::string& service,
                                 const std::string& amz_date) {
  const std::string datestamp = amz_date.substr(0, 8);
  const std::string scope = datestamp + "/" + region + "/" + service + "/aws4_request";

  const std::string string_to_sign = std::string(ALGORITHM) + "\n" +
    amz_date + "\n" +
    scope + "\n" +
    crypto::sha256_hex(canonical_request(request));

  // Derive the signing key: date -> region -> service -> request
  auto key = crypto::hmac_sha256(to_bytes("AWS4" + credentials.secret_access_key), datestamp);
  key = crypto::hmac_sha256(key, region);
  key = crypto::hmac_sha256(key, service);
  key = crypto::hmac_sha256(key, "aws4_request");

  const std::string signature = crypto::to_hex(crypto::hmac_sha256(key, string_to_sign));

  return std::string(ALGORITHM) +
    " Credential=" + credentials.access_key_id + "/" + scope +
    ",SignedHeaders=" + signed_headers(request) +
    ",Signature=" + signature;
}

} // namespace aws
} // namespace store
} // namespace hvault
