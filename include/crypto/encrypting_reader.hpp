#ifndef ENCSTREAM_CRYPTO_ENCRYPTING_READER_HPP
#define ENCSTREAM_CRYPTO_ENCRYPTING_READER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include "aead.hpp"
#include "crypto_error.hpp"
#include "framing.hpp"
#include "io/source.hpp"

namespace encstream::crypto {

// Seekable, encrypted view over a plaintext source. Reading yields the stream
// header followed by one AEAD block per BLOCK_SIZE bytes of plaintext.
//
// The reader takes exclusive ownership of the source: its cursor encodes
// which block comes next, so nothing else may move it while the reader lives.
class EncryptingReader {
public:
  // ---- CONSTRUCTOR ----
  // Throws InvalidInputError for a zero-length source and
  // InitializationError for a key of the wrong size
  EncryptingReader(std::unique_ptr<io::Source> source, const std::vector<uint8_t>& key);

  EncryptingReader(const EncryptingReader&) = delete;
  EncryptingReader& operator=(const EncryptingReader&) = delete;


  // ---- READ OPERATIONS ----
  // Fills up to length bytes of buffer, returns the number written.
  // Returns less than length only at the end of the ciphertext.
  std::size_t read(uint8_t* buffer, std::size_t length);
  std::vector<uint8_t> read(std::size_t length);
  // Reads from the current position to the end
  std::vector<uint8_t> read_all();


  // ---- POSITIONING ----
  // Moves to a ciphertext offset, clamped to [0, output_size()].
  // Returns the new absolute position.
  uint64_t seek(int64_t offset, io::Whence whence = io::Whence::Set);
  uint64_t tell() const;


  // ---- LIFECYCLE ----
  // Releases the source. Further reads, seeks and tells throw ClosedStreamError.
  void close();
  bool closed() const { return closed_; }


  // ---- GETTERS ----
  uint64_t output_size() const { return output_size_; }
  uint64_t source_size() const { return source_size_; }
  std::size_t header_size() const { return header_bytes_.size(); }
  const HeaderBytes& header() const { return header_bytes_; }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<io::Source> source_;
  Aead aead_;
  StreamHeader header_;
  HeaderBytes header_bytes_{};
  uint64_t source_size_{0};
  uint64_t output_size_{0};
  bool closed_{false};

  // Ciphertext produced but not yet handed out. While the source cursor is at
  // 0 this holds (a suffix of) the header.
  std::vector<uint8_t> pending_;
  std::size_t pending_pos_{0};
  // Scratch space for one plaintext block
  std::vector<uint8_t> plain_;


  // ---- BLOCK PROCESSING ----
  // Reads and encrypts the block starting at the current source cursor,
  // returns an empty vector at the end of the source
  std::vector<uint8_t> next_block();
  bool at_source_end() const;
  std::size_t pending_size() const { return pending_.size() - pending_pos_; }
  void check_open(const char* operation) const;
};

} // namespace encstream::crypto

#endif // ENCSTREAM_CRYPTO_ENCRYPTING_READER_HPP
