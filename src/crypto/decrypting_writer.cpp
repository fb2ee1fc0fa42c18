#include "crypto/decrypting_writer.hpp"
#include "crypto/position.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace encstream::crypto {

const char* to_string(DecryptingWriter::State state) {
  switch (state) {
    case DecryptingWriter::State::AwaitingHeader: return "AwaitingHeader";
    case DecryptingWriter::State::Streaming:      return "Streaming";
    case DecryptingWriter::State::Complete:       return "Complete";
    case DecryptingWriter::State::Failed:         return "Failed";
    default:                                      return "Unknown";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DecryptingWriter::DecryptingWriter(std::unique_ptr<io::Sink> sink,
                                   const std::vector<uint8_t>& key)
  : sink_(std::move(sink))
  , aead_(key) {
  if (!sink_) {
    BOOST_LOG_TRIVIAL(error) << "Decrypting writer: No sink provided";
    throw InvalidInputError("Decrypting writer: Sink must not be null");
  }
  buffer_.reserve(OUTPUT_BLOCK_SIZE);
  BOOST_LOG_TRIVIAL(info) << "Decrypting writer: Initialized";
}

DecryptingWriter::~DecryptingWriter() {
  if (closed_ || !sink_) {
    return;
  }
  if (state_ != State::Complete) {
    BOOST_LOG_TRIVIAL(warning) << "Decrypting writer: Destroyed in state " << to_string(state_)
                               << " without end_stream()";
  }
  try {
    close();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Decrypting writer: Failed to flush sink on destruction: " << e.what();
  }
}

//==============================================
// WRITE OPERATIONS
//==============================================

std::size_t DecryptingWriter::write(const uint8_t* data, std::size_t size) {
  check_open("write to");

  std::size_t consumed = 0;
  while (consumed < size) {
    if (state_ == State::Complete) {
      BOOST_LOG_TRIVIAL(error) << "Decrypting writer: " << size - consumed
                               << " bytes follow the final block";
      rollback();
      throw TrailingDataError("Ciphertext continues after the final block");
    }

    // Only take what completes the current header or block
    const std::size_t unit = state_ == State::AwaitingHeader ? HEADER_SIZE : OUTPUT_BLOCK_SIZE;
    const std::size_t take = std::min(unit - buffer_.size(), size - consumed);
    buffer_.insert(buffer_.end(), data + consumed, data + consumed + take);
    consumed += take;

    if (buffer_.size() < unit) {
      break;
    }

    if (state_ == State::AwaitingHeader) {
      parse_header();
    } else {
      process_block(false);
    }
  }

  return size;
}

std::size_t DecryptingWriter::write(const std::vector<uint8_t>& data) {
  return write(data.data(), data.size());
}

void DecryptingWriter::end_stream() {
  if (closed_ && state_ == State::Complete) {
    return;
  }
  check_open("end");

  // The residue is always shorter than a full block, so it can only be
  // the final one
  if (state_ == State::Streaming && !buffer_.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Decrypting writer: Decrypting " << buffer_.size()
                             << " residual bytes as final block";
    process_block(true);
  }

  if (state_ != State::Complete) {
    BOOST_LOG_TRIVIAL(error) << "Decrypting writer: Stream ended in state " << to_string(state_)
                             << " before the final block";
    rollback();
    throw IncompleteStreamError("Stream ended before its final block was received");
  }

  close();
}

//==============================================
// STREAM PROCESSING
//==============================================

void DecryptingWriter::parse_header() {
  try {
    const StreamHeader header = StreamHeader::parse(buffer_.data(), buffer_.size());
    file_nonce_ = header.file_nonce;
  }
  catch (const MalformedHeaderError&) {
    // Nothing has been written yet, so there is nothing to roll back
    state_ = State::Failed;
    close();
    throw;
  }

  buffer_.clear();
  state_ = State::Streaming;
  BOOST_LOG_TRIVIAL(debug) << "Decrypting writer: Header parsed";
}

void DecryptingWriter::process_block(bool known_to_be_last) {
  const uint64_t sink_position = sink_->tell();
  if (sink_position % BLOCK_SIZE != 0) {
    BOOST_LOG_TRIVIAL(error) << "Decrypting writer: Sink position " << sink_position
                             << " is not block aligned";
    throw io::IoError("Decrypting writer: Sink cursor moved outside of the writer");
  }

  // The block index is bound to the number of blocks already committed,
  // which is what makes reordered blocks fail to authenticate
  const uint64_t block_index = position::block_index_for_plain_offset(sink_position);

  Nonce regular_nonce{};
  Nonce final_nonce{};
  try {
    regular_nonce = make_nonce(file_nonce_, block_index, false);
    final_nonce = make_nonce(file_nonce_, block_index, true);
  }
  catch (const CapacityExceededError&) {
    state_ = State::Failed;
    close();
    throw;
  }

  std::optional<std::vector<uint8_t>> plaintext;
  bool is_last = known_to_be_last;

  if (!known_to_be_last) {
    plaintext = aead_.open(buffer_.data(), buffer_.size(), regular_nonce);
    is_last = !plaintext.has_value();
  }

  if (is_last) {
    plaintext = aead_.open(buffer_.data(), buffer_.size(), final_nonce);
    if (!plaintext) {
      BOOST_LOG_TRIVIAL(error) << "Decrypting writer: Failed to decrypt block " << block_index;
      rollback();
      throw AuthenticationError(
          "Failed to decrypt block with index " + std::to_string(block_index) +
          "; the data was corrupted or tampered with. Plaintext written so far has been "
          "discarded and the stream closed");
    }
  }

  buffer_.clear();
  const std::size_t written = sink_->write(plaintext->data(), plaintext->size());
  if (written != plaintext->size()) {
    BOOST_LOG_TRIVIAL(error) << "Decrypting writer: Sink accepted " << written << " of "
                             << plaintext->size() << " bytes of block " << block_index;
    rollback();
    throw io::IoError("Decrypting writer: Short write to sink");
  }

  BOOST_LOG_TRIVIAL(debug) << "Decrypting writer: Decrypted block " << block_index << " ("
                           << plaintext->size() << " bytes" << (is_last ? ", final" : "") << ")";

  if (is_last) {
    state_ = State::Complete;
    BOOST_LOG_TRIVIAL(info) << "Decrypting writer: Stream complete, "
                            << sink_->tell() << " bytes of plaintext";
    close();
  }
}

void DecryptingWriter::rollback() {
  BOOST_LOG_TRIVIAL(warning) << "Decrypting writer: Rolling back " << sink_->tell()
                             << " bytes of plaintext";
  state_ = State::Failed;
  buffer_.clear();
  sink_->seek(0);
  sink_->truncate(0);
  close();
}

//==============================================
// LIFECYCLE
//==============================================

void DecryptingWriter::flush() {
  check_open("flush");
  sink_->flush();
}

void DecryptingWriter::close() {
  if (closed_) {
    return;
  }
  // Closed even if the flush throws
  closed_ = true;
  sink_->flush();
  BOOST_LOG_TRIVIAL(debug) << "Decrypting writer: Closed in state " << to_string(state_);
}

std::unique_ptr<io::Sink> DecryptingWriter::release_sink() {
  if (sink_) {
    close();
  }
  return std::move(sink_);
}

uint64_t DecryptingWriter::tell() const {
  if (!sink_) {
    throw ClosedStreamError("Decrypting writer: Sink has been released");
  }
  if (state_ == State::AwaitingHeader) {
    return buffer_.size();
  }
  // output_size() of a block-aligned plaintext length is the start of the
  // next ciphertext block; after completion it is the full ciphertext length
  return position::output_size(sink_->tell()) + buffer_.size();
}

void DecryptingWriter::check_open(const char* operation) const {
  if (closed_ || !sink_) {
    BOOST_LOG_TRIVIAL(error) << "Decrypting writer: Attempt to " << operation << " a closed writer";
    throw ClosedStreamError(std::string("Decrypting writer: Cannot ") + operation + " a closed writer");
  }
}

} // namespace encstream::crypto
