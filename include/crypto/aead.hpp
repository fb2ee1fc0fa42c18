#ifndef ENCSTREAM_CRYPTO_AEAD_HPP
#define ENCSTREAM_CRYPTO_AEAD_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include "crypto_error.hpp"
#include "framing.hpp"

namespace encstream::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-GCM with a 24 byte IV and the 16 byte tag appended to the
// ciphertext. No associated data.
class Aead {
public:
  static constexpr std::size_t KEY_SIZE = 32;     // 256 bits for AES-256

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Aead(const std::vector<uint8_t>& key);
  ~Aead();

  Aead(const Aead&) = delete;
  Aead& operator=(const Aead&) = delete;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Returns ciphertext || tag (size + TAG_SIZE bytes)
  std::vector<uint8_t> seal(const uint8_t* plaintext, std::size_t size, const Nonce& nonce);
  // Returns the plaintext, or nullopt if the tag does not verify
  std::optional<std::vector<uint8_t>> open(const uint8_t* ciphertext, std::size_t size,
                                           const Nonce& nonce);

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> key_;
  std::unique_ptr<CipherContext> context_;


  // ---- INITIALIZATION ----
  // Resets the context and loads cipher, IV length, key and nonce
  void initializeCipher(const Nonce& nonce, bool encrypting);
};


// ---- KEY PROVIDER ----
// Cryptographically secure random bytes (OpenSSL RAND_bytes)
std::vector<uint8_t> random_bytes(std::size_t size);
// Fresh Aead::KEY_SIZE byte key
std::vector<uint8_t> generate_key();

} // namespace encstream::crypto

#endif // ENCSTREAM_CRYPTO_AEAD_HPP
