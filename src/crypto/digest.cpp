#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace hvault::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// HASHING
//==============================================

Bytes sha256(std::string_view data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext context;

  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to initialize SHA-256 context";
    throw DigestError("Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(context.get(), data.data(), data.size())) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to update SHA-256 context";
    throw DigestError("Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to finalize SHA-256 context";
    throw DigestError("Failed to finalize hash");
  }

  return Bytes(hash, hash + hash_len);
}

std::string sha256_hex(std::string_view data) {
  return to_hex(sha256(data));
}

Bytes hmac_sha256(const Bytes& key, std::string_view data) {
  unsigned char mac[EVP_MAX_MD_SIZE];
  unsigned int mac_len = 0;

  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(),
            mac, &mac_len)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: HMAC-SHA256 computation failed";
    throw DigestError("Failed to compute HMAC");
  }

  return Bytes(mac, mac + mac_len);
}

std::string to_hex(const Bytes& bytes) {
  std::stringstream ss;
  for (uint8_t byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace hvault::crypto
