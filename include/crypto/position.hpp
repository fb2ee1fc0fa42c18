#ifndef ENCSTREAM_CRYPTO_POSITION_HPP
#define ENCSTREAM_CRYPTO_POSITION_HPP

#include <cstdint>
#include "framing.hpp"

// Conversions between the plaintext coordinate space (offsets into the
// source) and the ciphertext coordinate space (offsets into header + blocks).
// Block indices are zero-based.
namespace encstream::crypto::position {

// ---- PLAINTEXT SPACE ----
constexpr uint64_t block_index_for_plain_offset(uint64_t offset) {
  return offset / BLOCK_SIZE;
}

constexpr uint64_t plain_block_offset(uint64_t block_index) {
  return block_index * BLOCK_SIZE;
}

// Number of blocks a source of this length is split into
constexpr uint64_t block_count(uint64_t source_size) {
  return (source_size + BLOCK_SIZE - 1) / BLOCK_SIZE;
}

// Index of the final block. A source that is an exact multiple of BLOCK_SIZE
// ends on a full block, hence the - 1. Requires source_size > 0.
constexpr uint64_t last_block_index(uint64_t source_size) {
  return (source_size - 1) / BLOCK_SIZE;
}

constexpr uint64_t plain_block_size(uint64_t block_index, uint64_t source_size) {
  const uint64_t start = plain_block_offset(block_index);
  const uint64_t left = source_size - start;
  return left < BLOCK_SIZE ? left : BLOCK_SIZE;
}


// ---- CIPHERTEXT SPACE ----
constexpr uint64_t cipher_block_offset(uint64_t block_index) {
  return HEADER_SIZE + block_index * OUTPUT_BLOCK_SIZE;
}

constexpr uint64_t cipher_block_size(uint64_t block_index, uint64_t source_size) {
  return plain_block_size(block_index, source_size) + TAG_SIZE;
}

// Block owning a ciphertext offset past the header. A block boundary belongs
// to the end of the preceding block, not to the start of the next one.
// Requires offset > HEADER_SIZE.
constexpr uint64_t block_index_for_cipher_offset(uint64_t offset) {
  return (offset - HEADER_SIZE - 1) / OUTPUT_BLOCK_SIZE;
}

// Total ciphertext length (header included) for a source of this length
constexpr uint64_t output_size(uint64_t source_size) {
  const uint64_t full_blocks = source_size / BLOCK_SIZE;
  const uint64_t left_over = source_size - full_blocks * BLOCK_SIZE;

  uint64_t size = HEADER_SIZE + full_blocks * OUTPUT_BLOCK_SIZE;
  if (left_over > 0) {
    size += left_over + TAG_SIZE;
  }
  return size;
}

} // namespace encstream::crypto::position

#endif // ENCSTREAM_CRYPTO_POSITION_HPP
