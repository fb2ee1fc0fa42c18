#include "crypto/aead.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <limits>
#include <boost/log/trivial.hpp>

namespace encstream::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("AEAD: Failed to create cipher context");
    }
  }

  // Free cipher context when object is destroyed
  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  // Access the underlying context
  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Aead::Aead(const std::vector<uint8_t>& key) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "AEAD: Invalid key size: " << key.size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }

  key_ = key;
  context_ = std::make_unique<CipherContext>();
  BOOST_LOG_TRIVIAL(debug) << "AEAD: AES-256-GCM context ready";
}

Aead::~Aead() {
  OPENSSL_cleanse(key_.data(), key_.size());
}

//==============================================
// CIPHER INITIALIZATION
//==============================================

void Aead::initializeCipher(const Nonce& nonce, bool encrypting) {
  EVP_CIPHER_CTX_reset(context_->get());

  const EVP_CIPHER* cipher = EVP_aes_256_gcm();
  if (encrypting) {
    if (EVP_EncryptInit_ex(context_->get(), cipher, nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(context_->get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(context_->get(), nullptr, nullptr, key_.data(), nonce.data()) != 1) {
      throw EncryptionError("AEAD: Failed to initialize encryption context");
    }
  } else {
    if (EVP_DecryptInit_ex(context_->get(), cipher, nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(context_->get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(context_->get(), nullptr, nullptr, key_.data(), nonce.data()) != 1) {
      throw InitializationError("AEAD: Failed to initialize decryption context");
    }
  }
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::vector<uint8_t> Aead::seal(const uint8_t* plaintext, std::size_t size, const Nonce& nonce) {
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw EncryptionError("AEAD: Plaintext too large for a single seal");
  }

  initializeCipher(nonce, true);

  std::vector<uint8_t> output(size + TAG_SIZE);
  int outlen = 0;
  int finallen = 0;

  if (size > 0 &&
      EVP_EncryptUpdate(context_->get(), output.data(), &outlen, plaintext,
                        static_cast<int>(size)) != 1) {
    throw EncryptionError("AEAD: Failed to encrypt data block");
  }
  if (EVP_EncryptFinal_ex(context_->get(), output.data() + outlen, &finallen) != 1) {
    throw EncryptionError("AEAD: Failed to finalize encryption");
  }
  if (static_cast<std::size_t>(outlen + finallen) != size) {
    throw EncryptionError("AEAD: Unexpected ciphertext length");
  }
  // Export the tag right behind the ciphertext
  if (EVP_CIPHER_CTX_ctrl(context_->get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(TAG_SIZE), output.data() + size) != 1) {
    throw EncryptionError("AEAD: Failed to export authentication tag");
  }

  BOOST_LOG_TRIVIAL(trace) << "AEAD: Sealed " << size << " bytes";
  return output;
}

std::optional<std::vector<uint8_t>> Aead::open(const uint8_t* ciphertext, std::size_t size,
                                               const Nonce& nonce) {
  if (size < TAG_SIZE) {
    BOOST_LOG_TRIVIAL(debug) << "AEAD: Ciphertext of " << size << " bytes is shorter than the tag";
    return std::nullopt;
  }
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }

  initializeCipher(nonce, false);

  const std::size_t body = size - TAG_SIZE;
  std::vector<uint8_t> output(body);
  int outlen = 0;
  int finallen = 0;

  if (body > 0 &&
      EVP_DecryptUpdate(context_->get(), output.data(), &outlen, ciphertext,
                        static_cast<int>(body)) != 1) {
    return std::nullopt;
  }
  // GCM wants a non-const tag pointer, the tag is only read
  if (EVP_CIPHER_CTX_ctrl(context_->get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                          const_cast<uint8_t*>(ciphertext + body)) != 1) {
    return std::nullopt;
  }
  if (EVP_DecryptFinal_ex(context_->get(), output.data() + outlen, &finallen) != 1) {
    BOOST_LOG_TRIVIAL(trace) << "AEAD: Tag verification failed";
    OPENSSL_cleanse(output.data(), output.size());
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(trace) << "AEAD: Opened " << body << " bytes";
  return output;
}

//==============================================
// KEY PROVIDER
//==============================================

std::vector<uint8_t> random_bytes(std::size_t size) {
  std::vector<uint8_t> bytes(size);
  if (size > 0 && RAND_bytes(bytes.data(), static_cast<int>(size)) != 1) {
    BOOST_LOG_TRIVIAL(error) << "AEAD: RAND_bytes failed for " << size << " bytes";
    throw InitializationError("Failed to generate random bytes");
  }
  return bytes;
}

std::vector<uint8_t> generate_key() {
  BOOST_LOG_TRIVIAL(debug) << "AEAD: Generating key";
  return random_bytes(Aead::KEY_SIZE);
}

} // namespace encstream::crypto
