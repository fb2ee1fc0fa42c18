#include "crypto/crypto_stream.hpp"
#include "crypto/decrypting_writer.hpp"
#include "crypto/encrypting_reader.hpp"
#include <openssl/crypto.h>
#include <array>
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace encstream::crypto {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CryptoStream::CryptoStream(const std::vector<uint8_t>& key) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Invalid key size: " << key.size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }
  key_ = key;
  BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Initialized";
}

CryptoStream::~CryptoStream() {
  OPENSSL_cleanse(key_.data(), key_.size());
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

uint64_t CryptoStream::encrypt(std::unique_ptr<io::Source> source, std::ostream& output) {
  if (!output.good()) {
    throw io::IoError("Crypto stream: Invalid output stream state");
  }

  EncryptingReader reader(std::move(source), key_);
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Starting encryption of " << reader.source_size() << " bytes";

  std::vector<uint8_t> buffer(BUFFER_SIZE);
  uint64_t total_bytes = 0;
  while (std::size_t n = reader.read(buffer.data(), buffer.size())) {
    writeOutputBlock(output, buffer.data(), n);
    total_bytes += n;
  }
  output.flush();

  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Completed encryption: wrote " << total_bytes << " bytes";
  return total_bytes;
}

std::unique_ptr<io::Sink> CryptoStream::decrypt(std::istream& input, std::unique_ptr<io::Sink> sink) {
  if (!input.good()) {
    throw io::IoError("Crypto stream: Invalid input stream state");
  }

  DecryptingWriter writer(std::move(sink), key_);
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Starting decryption";

  std::array<char, BUFFER_SIZE> buffer;
  while (input) {
    input.read(buffer.data(), buffer.size());
    const auto bytes_read = input.gcount();
    if (bytes_read > 0) {
      writer.write(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<std::size_t>(bytes_read));
    }
  }
  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Failed to read from input stream";
    throw io::IoError("Crypto stream: Failed to read from input stream");
  }

  writer.end_stream();
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Completed decryption: consumed " << writer.tell() << " bytes";
  return writer.release_sink();
}

//==============================================
// FILE OPERATIONS
//==============================================

uint64_t CryptoStream::encrypt_file(const std::filesystem::path& input,
                                    const std::filesystem::path& output) {
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Encrypting " << input.string() << " -> " << output.string();
  auto source = io::open_file_source(input);

  std::ofstream file(output, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw io::IoError("Crypto stream: Failed to create file: " + output.string());
  }

  try {
    return encrypt(std::move(source), file);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Encryption failed: " << e.what();
    file.close();
    removeOutput(output);
    throw;
  }
}

uint64_t CryptoStream::decrypt_file(const std::filesystem::path& input,
                                    const std::filesystem::path& output) {
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Decrypting " << input.string() << " -> " << output.string();
  std::ifstream file(input, std::ios::binary);
  if (!file) {
    throw io::IoError("Crypto stream: Failed to open file: " + input.string());
  }

  try {
    auto sink = decrypt(file, std::make_unique<io::FileSink>(output));
    return sink->tell();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Decryption failed: " << e.what();
    removeOutput(output);
    throw;
  }
}

//==============================================
// STREAM PROCESSING HELPERS
//==============================================

void CryptoStream::writeOutputBlock(std::ostream& output, const uint8_t* data, std::size_t length) {
  if (length > 0) {
    output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    if (!output.good()) {
      throw io::IoError("Crypto stream: Failed to write to output stream");
    }
  }
}

void CryptoStream::removeOutput(const std::filesystem::path& output) {
  std::error_code ec;
  std::filesystem::remove(output, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Crypto stream: Could not remove " << output.string() << ": " << ec.message();
  }
}

} // namespace encstream::crypto
