#include "crypto/digest.hpp"
#include "error/blob_error.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gridsync::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Digest: Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  reset();
}

Sha256::~Sha256() = default;


//==============================================
// HASHING
//==============================================

void Sha256::reset() {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Digest: Failed to initialize SHA-256 context");
  }
  finalized_ = false;
}

void Sha256::update(const void* data, size_t size) {
  if (size == 0) {
    return;
  }
  if (finalized_) {
    reset();
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Digest: Failed to update SHA-256 digest");
  }
}

std::string Sha256::finalize_hex() {
  if (finalized_) {
    reset();
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Digest: Failed to finalize SHA-256 digest");
  }
  finalized_ = true;

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string Sha256::hex_digest(const std::string& data) {
  Sha256 hasher;
  hasher.update(data.data(), data.size());
  return hasher.finalize_hex();
}


//==============================================
// RANDOMNESS
//==============================================

std::vector<uint8_t> random_bytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count == 0) {
    return bytes;
  }
  if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    unsigned long err = ERR_get_error();
    char err_buf[256];
    ERR_error_string_n(err, err_buf, sizeof(err_buf));
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to generate random bytes: " << err_buf;
    throw DigestError("Digest: Failed to generate random bytes");
  }
  return bytes;
}

} // namespace gridsync::crypto
