#ifndef ENCSTREAM_CRYPTO_DECRYPTING_WRITER_HPP
#define ENCSTREAM_CRYPTO_DECRYPTING_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include "aead.hpp"
#include "crypto_error.hpp"
#include "framing.hpp"
#include "io/sink.hpp"

namespace encstream::crypto {

// Consumes a ciphertext stream in chunks of any size and writes the verified
// plaintext to a sink.
//
// The final block is recognised from its nonce alone: every block is first
// opened as a regular block and, if that fails, as the final block. Callers
// must call end_stream() once all ciphertext has been written, otherwise a
// truncated stream is indistinguishable from one still in transit.
//
// On any authentication failure the sink is rewound and truncated to zero
// before the error is thrown, so unverified plaintext never stays visible.
class DecryptingWriter {
public:
  enum class State {
    AwaitingHeader,
    Streaming,
    Complete,
    Failed
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DecryptingWriter(std::unique_ptr<io::Sink> sink, const std::vector<uint8_t>& key);
  ~DecryptingWriter();

  DecryptingWriter(const DecryptingWriter&) = delete;
  DecryptingWriter& operator=(const DecryptingWriter&) = delete;


  // ---- WRITE OPERATIONS ----
  // Accepts the next chunk of ciphertext. Always consumes all size bytes or
  // throws.
  std::size_t write(const uint8_t* data, std::size_t size);
  std::size_t write(const std::vector<uint8_t>& data);
  // Declares the ciphertext finished. Decrypts any residue as the final block
  // and throws IncompleteStreamError unless the stream is complete.
  void end_stream();


  // ---- LIFECYCLE ----
  void flush();
  // Flushes the sink and closes the writer. The sink itself stays open.
  void close();
  // Closes the writer and hands the sink back to the caller
  std::unique_ptr<io::Sink> release_sink();


  // ---- GETTERS ----
  // Ciphertext offset consumed so far
  uint64_t tell() const;
  State state() const { return state_; }
  bool complete() const { return state_ == State::Complete; }
  bool closed() const { return closed_; }
  io::Sink& sink() { return *sink_; }
  std::size_t buffered() const { return buffer_.size(); }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<io::Sink> sink_;
  Aead aead_;
  State state_{State::AwaitingHeader};
  FileNonce file_nonce_{};
  bool closed_{false};
  // Bytes of the header or block currently being assembled. Never holds
  // more than one unit, so it stays below OUTPUT_BLOCK_SIZE between calls.
  std::vector<uint8_t> buffer_;


  // ---- STREAM PROCESSING ----
  void parse_header();
  // Decrypts buffer_ as the block at the sink's current position
  void process_block(bool known_to_be_last);
  // Discards all plaintext written so far and closes the writer
  void rollback();
  void check_open(const char* operation) const;
};

const char* to_string(DecryptingWriter::State state);

} // namespace encstream::crypto

#endif // ENCSTREAM_CRYPTO_DECRYPTING_WRITER_HPP
