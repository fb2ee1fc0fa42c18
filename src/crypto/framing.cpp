#include "crypto/framing.hpp"
#include "crypto/aead.hpp"
#include "crypto/byte_order.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace encstream::crypto {

//==============================================
// STREAM HEADER
//==============================================

StreamHeader StreamHeader::generate() {
  StreamHeader header;
  auto nonce = random_bytes(FILE_NONCE_SIZE);
  std::copy(nonce.begin(), nonce.end(), header.file_nonce.begin());
  BOOST_LOG_TRIVIAL(debug) << "Framing: Generated stream header v"
                           << header.version_major << "." << header.version_minor;
  return header;
}

StreamHeader StreamHeader::parse(const uint8_t* data, std::size_t size) {
  if (size < HEADER_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Framing: Header truncated: " << size
                             << " bytes (expected " << HEADER_SIZE << " bytes)";
    throw MalformedHeaderError("Header truncated");
  }

  StreamHeader header;
  header.version_major = ByteOrder::loadLittle<uint16_t>(data);
  header.version_minor = ByteOrder::loadLittle<uint16_t>(data + 2);

  if (header.version_major != VERSION_MAJOR || header.version_minor != VERSION_MINOR) {
    BOOST_LOG_TRIVIAL(error) << "Framing: Unsupported stream version "
                             << header.version_major << "." << header.version_minor
                             << " (expected " << VERSION_MAJOR << "." << VERSION_MINOR << ")";
    throw MalformedHeaderError("Unsupported stream version " +
                               std::to_string(header.version_major) + "." +
                               std::to_string(header.version_minor));
  }

  std::copy(data + 4, data + HEADER_SIZE, header.file_nonce.begin());
  return header;
}

HeaderBytes StreamHeader::serialize() const {
  HeaderBytes bytes{};
  ByteOrder::storeLittle<uint16_t>(bytes.data(), version_major);
  ByteOrder::storeLittle<uint16_t>(bytes.data() + 2, version_minor);
  std::copy(file_nonce.begin(), file_nonce.end(), bytes.begin() + 4);
  return bytes;
}

//==============================================
// NONCE CONSTRUCTION
//==============================================

Nonce make_nonce(const FileNonce& file_nonce, uint64_t block_index, bool is_last) {
  // Counters start at 1, block indices at 0
  if (block_index >= MAX_COUNTER) {
    BOOST_LOG_TRIVIAL(error) << "Framing: Block index " << block_index
                             << " exceeds the nonce counter range";
    throw CapacityExceededError("Stream too large; maximum block index surpassed");
  }

  uint32_t counter = static_cast<uint32_t>(block_index + 1);
  if (is_last) {
    counter |= FINAL_BLOCK_FLAG;
  }

  Nonce nonce{};
  std::copy(file_nonce.begin(), file_nonce.end(), nonce.begin());
  ByteOrder::storeLittle<uint32_t>(nonce.data() + FILE_NONCE_SIZE, counter);
  return nonce;
}

} // namespace encstream::crypto
