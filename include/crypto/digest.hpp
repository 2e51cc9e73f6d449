#ifndef GRIDSYNC_CRYPTO_DIGEST_HPP
#define GRIDSYNC_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace gridsync::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 used for content checksums and path hashing
class Sha256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING ----
  // Feeds more bytes into the running digest
  void update(const void* data, size_t size);
  // Finishes the digest and returns it as lowercase hex; the hasher is
  // reset afterwards and can be reused
  std::string finalize_hex();

  // One-shot helper
  static std::string hex_digest(const std::string& data);

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_{false};

  void reset();
};

// ---- RANDOMNESS ----
// Fills a buffer from the OpenSSL CSPRNG
std::vector<uint8_t> random_bytes(size_t count);

} // namespace gridsync::crypto

#endif // GRIDSYNC_CRYPTO_DIGEST_HPP
