#ifndef ENCSTREAM_CRYPTO_FRAMING_HPP
#define ENCSTREAM_CRYPTO_FRAMING_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include "crypto_error.hpp"

namespace encstream::crypto {

// ---- WIRE FORMAT CONSTANTS ----
// Plaintext bytes per block (the last block may be shorter)
inline constexpr std::size_t BLOCK_SIZE = std::size_t{1} << 20;
// Authentication tag appended to every ciphertext block (GCM)
inline constexpr std::size_t TAG_SIZE = 16;
// Ciphertext bytes per full block
inline constexpr std::size_t OUTPUT_BLOCK_SIZE = BLOCK_SIZE + TAG_SIZE;

inline constexpr std::size_t FILE_NONCE_SIZE = 20;
inline constexpr std::size_t COUNTER_SIZE = 4;
inline constexpr std::size_t NONCE_SIZE = FILE_NONCE_SIZE + COUNTER_SIZE;

// u16 major | u16 minor | file nonce
inline constexpr std::size_t HEADER_SIZE = 2 + 2 + FILE_NONCE_SIZE;
inline constexpr uint16_t VERSION_MAJOR = 1;
inline constexpr uint16_t VERSION_MINOR = 0;

// MSB of the nonce counter marks the last block of a stream
inline constexpr uint32_t FINAL_BLOCK_FLAG = uint32_t{1} << 31;
inline constexpr uint32_t MAX_COUNTER = FINAL_BLOCK_FLAG - 1;

using FileNonce = std::array<uint8_t, FILE_NONCE_SIZE>;
using Nonce = std::array<uint8_t, NONCE_SIZE>;
using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

static_assert(HEADER_SIZE == 24, "Header layout/size mismatch");
static_assert(NONCE_SIZE == 24, "Nonce layout/size mismatch");


// ---- STREAM HEADER ----
struct StreamHeader {
  uint16_t version_major = VERSION_MAJOR;
  uint16_t version_minor = VERSION_MINOR;
  FileNonce file_nonce{};

  // Creates a header for a new stream with a fresh random file nonce
  static StreamHeader generate();
  // Parses the first HEADER_SIZE bytes of a stream, throws MalformedHeaderError
  // on short input or an unsupported version
  static StreamHeader parse(const uint8_t* data, std::size_t size);

  HeaderBytes serialize() const;
};


// ---- NONCE CONSTRUCTION ----
// file_nonce || LE32(block_index + 1), with FINAL_BLOCK_FLAG set for the last
// block. Throws CapacityExceededError once the counter leaves 31 bits.
Nonce make_nonce(const FileNonce& file_nonce, uint64_t block_index, bool is_last);

} // namespace encstream::crypto

#endif // ENCSTREAM_CRYPTO_FRAMING_HPP
