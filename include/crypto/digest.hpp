#ifndef HVAULT_CRYPTO_DIGEST_HPP
#define HVAULT_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "crypto_error.hpp"

namespace hvault::crypto {

using Bytes = std::vector<uint8_t>;

// SHA-256 of data using OpenSSL EVP, raw and lowercase hex forms
Bytes sha256(std::string_view data);
std::string sha256_hex(std::string_view data);

// HMAC-SHA256 keyed with key over data
Bytes hmac_sha256(const Bytes& key, std::string_view data);

// Lowercase hexadecimal rendering of raw bytes
std::string to_hex(const Bytes& bytes);

} // namespace hvault::crypto

#endif // HVAULT_CRYPTO_DIGEST_HPP
