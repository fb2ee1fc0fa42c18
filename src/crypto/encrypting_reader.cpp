#include "crypto/encrypting_reader.hpp"
#include "crypto/position.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace encstream::crypto {

//==============================================
// CONSTRUCTOR
//==============================================

EncryptingReader::EncryptingReader(std::unique_ptr<io::Source> source,
                                   const std::vector<uint8_t>& key)
  : source_(std::move(source))
  , aead_(key) {
  if (!source_) {
    BOOST_LOG_TRIVIAL(error) << "Encrypting reader: No source provided";
    throw InvalidInputError("Encrypting reader: Source must not be null");
  }

  // Determine the size of the source, then rewind
  source_size_ = source_->seek(0, io::Whence::End);
  source_->seek(0, io::Whence::Set);

  if (source_size_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Encrypting reader: Zero-length source";
    throw InvalidInputError("Zero-length sources are unsupported");
  }

  header_ = StreamHeader::generate();
  header_bytes_ = header_.serialize();
  output_size_ = position::output_size(source_size_);

  // Nothing has been read yet, so the whole header is pending
  pending_.assign(header_bytes_.begin(), header_bytes_.end());
  pending_pos_ = 0;
  plain_.reserve(BLOCK_SIZE);

  BOOST_LOG_TRIVIAL(info) << "Encrypting reader: Initialized over " << source_size_
                          << " bytes (" << position::block_count(source_size_)
                          << " blocks, output size " << output_size_ << ")";
}

//==============================================
// BLOCK PROCESSING
//==============================================

bool EncryptingReader::at_source_end() const {
  return source_->tell() == source_size_;
}

std::vector<uint8_t> EncryptingReader::next_block() {
  if (at_source_end()) {
    return {};
  }

  const uint64_t source_position = source_->tell();
  if (source_position % BLOCK_SIZE != 0) {
    BOOST_LOG_TRIVIAL(error) << "Encrypting reader: Source cursor " << source_position
                             << " is not block aligned";
    throw io::IoError("Encrypting reader: Source cursor moved outside of the reader");
  }

  const uint64_t block_index = position::block_index_for_plain_offset(source_position);
  const auto block_size =
      static_cast<std::size_t>(position::plain_block_size(block_index, source_size_));
  const bool is_last = source_position + block_size == source_size_;

  // Checked before reading so an oversized stream fails without side effects
  const Nonce nonce = make_nonce(header_.file_nonce, block_index, is_last);

  plain_.resize(block_size);
  std::size_t total = 0;
  while (total < block_size) {
    const std::size_t n = source_->read(plain_.data() + total, block_size - total);
    if (n == 0) {
      break;
    }
    total += n;
  }

  if (total < block_size) {
    BOOST_LOG_TRIVIAL(error) << "Encrypting reader: Source ended after " << source_position + total
                             << " bytes, expected " << source_size_;
    throw io::IoError("Encrypting reader: Source is shorter than its reported size");
  }

  BOOST_LOG_TRIVIAL(debug) << "Encrypting reader: Encrypting block " << block_index
                           << " (" << block_size << " bytes" << (is_last ? ", final" : "") << ")";
  return aead_.seal(plain_.data(), block_size, nonce);
}

//==============================================
// READ OPERATIONS
//==============================================

std::size_t EncryptingReader::read(uint8_t* buffer, std::size_t length) {
  check_open("read");

  // Serve the read from the pending block if possible
  if (length <= pending_size()) {
    std::copy_n(pending_.begin() + static_cast<std::ptrdiff_t>(pending_pos_), length, buffer);
    pending_pos_ += length;
    return length;
  }

  // Otherwise drain it ...
  std::size_t bytes_written = pending_size();
  std::copy(pending_.begin() + static_cast<std::ptrdiff_t>(pending_pos_), pending_.end(), buffer);
  pending_.clear();
  pending_pos_ = 0;

  // ... and keep encrypting blocks until the buffer is full or the source runs out
  while (bytes_written < length && !at_source_end()) {
    std::vector<uint8_t> block = next_block();
    const std::size_t left_to_write = length - bytes_written;

    if (left_to_write <= block.size()) {
      std::copy_n(block.begin(), left_to_write, buffer + bytes_written);
      bytes_written += left_to_write;
      pending_ = std::move(block);
      pending_pos_ = left_to_write;
      break;
    }

    std::copy(block.begin(), block.end(), buffer + bytes_written);
    bytes_written += block.size();
  }

  BOOST_LOG_TRIVIAL(trace) << "Encrypting reader: Read " << bytes_written << " of " << length << " bytes";
  return bytes_written;
}

std::vector<uint8_t> EncryptingReader::read(std::size_t length) {
  std::vector<uint8_t> data(length);
  data.resize(read(data.data(), length));
  return data;
}

std::vector<uint8_t> EncryptingReader::read_all() {
  const uint64_t position = tell();
  return read(static_cast<std::size_t>(output_size_ - position));
}

//==============================================
// POSITIONING
//==============================================

uint64_t EncryptingReader::tell() const {
  check_open("tell");

  const uint64_t source_position = source_->tell();

  // Still inside the header
  if (source_position == 0) {
    return HEADER_SIZE - pending_size();
  }

  // The pending bytes belong to the block that ends at the source cursor
  uint64_t block_index = 0;
  if (source_position == source_size_) {
    block_index = position::last_block_index(source_size_);
  } else {
    if (source_position % BLOCK_SIZE != 0) {
      throw io::IoError("Encrypting reader: Source cursor moved outside of the reader");
    }
    block_index = position::block_index_for_plain_offset(source_position) - 1;
  }

  const uint64_t bytes_read_from_block =
      position::cipher_block_size(block_index, source_size_) - pending_size();
  return position::cipher_block_offset(block_index) + bytes_read_from_block;
}

uint64_t EncryptingReader::seek(int64_t offset, io::Whence whence) {
  check_open("seek");

  uint64_t base = 0;
  switch (whence) {
    case io::Whence::Set:     base = 0; break;
    case io::Whence::Current: base = tell(); break;
    case io::Whence::End:     base = output_size_; break;
  }

  // Clamp to [0, output_size] before checking for the header region. The
  // distances are compared unsigned so no offset can overflow.
  uint64_t position = 0;
  if (offset >= 0) {
    const auto forward = static_cast<uint64_t>(offset);
    position = forward > output_size_ - base ? output_size_ : base + forward;
  } else {
    const uint64_t backward = uint64_t{0} - static_cast<uint64_t>(offset);
    position = backward > base ? 0 : base - backward;
  }

  if (position <= HEADER_SIZE) {
    source_->seek(0, io::Whence::Set);
    pending_.assign(header_bytes_.begin(), header_bytes_.end());
    pending_pos_ = static_cast<std::size_t>(position);
    BOOST_LOG_TRIVIAL(trace) << "Encrypting reader: Seek to " << position << " (header)";
    return position;
  }

  const uint64_t block_index = position::block_index_for_cipher_offset(position);
  const uint64_t block_offset = position - position::cipher_block_offset(block_index);

  // Fail before the source moves so the current position stays valid
  if (block_index >= MAX_COUNTER) {
    BOOST_LOG_TRIVIAL(error) << "Encrypting reader: Seek to " << position << " needs block "
                             << block_index << ", beyond the nonce counter range";
    throw CapacityExceededError("Stream too large; maximum block index surpassed");
  }

  // Re-encrypt the owning block and skip what precedes the target
  source_->seek(static_cast<int64_t>(position::plain_block_offset(block_index)), io::Whence::Set);
  pending_ = next_block();
  pending_pos_ = static_cast<std::size_t>(block_offset);

  BOOST_LOG_TRIVIAL(trace) << "Encrypting reader: Seek to " << position << " (block "
                           << block_index << ", offset " << block_offset << ")";
  return position;
}

//==============================================
// LIFECYCLE
//==============================================

void EncryptingReader::close() {
  if (closed_) {
    return;
  }
  source_.reset();
  pending_.clear();
  pending_pos_ = 0;
  closed_ = true;
  BOOST_LOG_TRIVIAL(info) << "Encrypting reader: Closed";
}

void EncryptingReader::check_open(const char* operation) const {
  if (closed_) {
    BOOST_LOG_TRIVIAL(error) << "Encrypting reader: " << operation << " on closed reader";
    throw ClosedStreamError(std::string("Encrypting reader: Cannot ") + operation + " a closed reader");
  }
}

} // namespace encstream::crypto
