#ifndef ENCSTREAM_CRYPTO_STREAM_HPP
#define ENCSTREAM_CRYPTO_STREAM_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <vector>
#include "aead.hpp"
#include "crypto_error.hpp"
#include "io/sink.hpp"
#include "io/source.hpp"

namespace encstream::crypto {

// Whole-stream pipelines on top of EncryptingReader and DecryptingWriter
class CryptoStream {
public:
  static constexpr std::size_t KEY_SIZE = Aead::KEY_SIZE;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CryptoStream(const std::vector<uint8_t>& key);
  ~CryptoStream();

  CryptoStream(const CryptoStream&) = delete;
  CryptoStream& operator=(const CryptoStream&) = delete;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Encrypts the whole source into output, returns the ciphertext size
  uint64_t encrypt(std::unique_ptr<io::Source> source, std::ostream& output);
  // Decrypts all of input into sink and hands the sink back once the stream
  // is verified complete
  std::unique_ptr<io::Sink> decrypt(std::istream& input, std::unique_ptr<io::Sink> sink);


  // ---- FILE OPERATIONS ----
  // Both remove a partially written output file on failure
  uint64_t encrypt_file(const std::filesystem::path& input, const std::filesystem::path& output);
  uint64_t decrypt_file(const std::filesystem::path& input, const std::filesystem::path& output);

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> key_;
  static constexpr std::size_t BUFFER_SIZE = 64 * 1024;


  // ---- STREAM PROCESSING ----
  // Safely writes a chunk of ciphertext to the output stream
  void writeOutputBlock(std::ostream& output, const uint8_t* data, std::size_t length);
  // Deletes an output file left behind by a failed operation
  void removeOutput(const std::filesystem::path& output);
};

} // namespace encstream::crypto

#endif // ENCSTREAM_CRYPTO_STREAM_HPP
