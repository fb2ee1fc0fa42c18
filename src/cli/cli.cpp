#include "cli/cli.hpp"
#include "crypto/aead.hpp"
#include "crypto/crypto_stream.hpp"
#include <openssl/crypto.h>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>

namespace encstream {
namespace cli {

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(std::ostream& out, std::ostream& err)
  : out_(out)
  , err_(err) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}

//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::run(const CommandOptions& options) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << options.command;

  try {
    if (options.command == "keygen") {
      handle_keygen_command(options);
    }
    else if (options.command == "encrypt") {
      handle_encrypt_command(options);
    }
    else if (options.command == "decrypt") {
      handle_decrypt_command(options);
    }
    else {
      throw UsageError("Unknown command: " + options.command);
    }
  }
  catch (const UsageError& e) {
    log_and_display_error("Usage error", e.what());
    return EXIT_USAGE;
  }
  catch (const std::exception& e) {
    log_and_display_error("Error running " + options.command, e.what());
    return EXIT_FAILURE_OPERATION;
  }

  return EXIT_OK;
}

void CLI::handle_keygen_command(const CommandOptions& options) {
  auto key = crypto::generate_key();
  const std::string hex = encode_key(key);
  OPENSSL_cleanse(key.data(), key.size());

  if (options.output.empty()) {
    out_ << hex << std::endl;
    return;
  }

  std::ofstream file(options.output, std::ios::trunc);
  if (!file || !(file << hex << '\n')) {
    throw std::runtime_error("Failed to write key file: " + options.output.string());
  }
  BOOST_LOG_TRIVIAL(info) << "Key written to " << options.output.string();
}

void CLI::handle_encrypt_command(const CommandOptions& options) {
  require_paths(options);
  auto key = load_key(options.key_file);
  crypto::CryptoStream stream(key);
  OPENSSL_cleanse(key.data(), key.size());

  const uint64_t written = stream.encrypt_file(options.input, options.output);
  out_ << "Encrypted " << options.input.string() << " -> " << options.output.string()
       << " (" << written << " bytes)" << std::endl;
}

void CLI::handle_decrypt_command(const CommandOptions& options) {
  require_paths(options);
  auto key = load_key(options.key_file);
  crypto::CryptoStream stream(key);
  OPENSSL_cleanse(key.data(), key.size());

  const uint64_t written = stream.decrypt_file(options.input, options.output);
  out_ << "Decrypted " << options.input.string() << " -> " << options.output.string()
       << " (" << written << " bytes)" << std::endl;
}

void CLI::require_paths(const CommandOptions& options) const {
  if (options.input.empty() || options.output.empty()) {
    throw UsageError(options.command + " requires both -i <input> and -o <output>");
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  err_ << message << ": " << error << std::endl;
}

//==============================================
// KEY HANDLING
//==============================================

std::vector<uint8_t> CLI::load_key(const std::string& key_file) {
  std::string hex;

  if (!key_file.empty()) {
    std::ifstream file(key_file);
    if (!file) {
      throw UsageError("Cannot open key file: " + key_file);
    }
    std::stringstream contents;
    contents << file.rdbuf();
    hex = contents.str();
    BOOST_LOG_TRIVIAL(debug) << "Key loaded from file " << key_file;
  } else {
    const char* env = std::getenv(KEY_ENV_VAR);
    if (!env) {
      throw UsageError(std::string("No key given; use -k <keyfile> or set ") + KEY_ENV_VAR);
    }
    hex = env;
    BOOST_LOG_TRIVIAL(debug) << "Key loaded from " << KEY_ENV_VAR;
  }

  boost::algorithm::trim(hex);
  return decode_key(hex);
}

std::vector<uint8_t> CLI::decode_key(const std::string& hex) {
  if (hex.size() != crypto::Aead::KEY_SIZE * 2) {
    throw UsageError("Key must be " + std::to_string(crypto::Aead::KEY_SIZE * 2) + " hex characters");
  }

  std::vector<uint8_t> key;
  key.reserve(crypto::Aead::KEY_SIZE);
  try {
    boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(key));
  }
  catch (const boost::algorithm::hex_decode_error&) {
    throw UsageError("Key contains non-hex characters");
  }
  return key;
}

std::string CLI::encode_key(const std::vector<uint8_t>& key) {
  std::string hex;
  boost::algorithm::hex_lower(key.begin(), key.end(), std::back_inserter(hex));
  return hex;
}

} // namespace cli
} // namespace encstream
