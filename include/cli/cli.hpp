#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace encstream {
namespace cli {

// Environment variable consulted when no key file is given
inline constexpr const char* KEY_ENV_VAR = "ENCSTREAM_KEY";

enum ExitCode : int {
  EXIT_OK = 0,
  EXIT_USAGE = 1,
  EXIT_FAILURE_OPERATION = 2
};

struct CommandOptions {
  std::string command;
  std::filesystem::path input;
  std::filesystem::path output;
  std::string key_file;
};

class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

class CLI {
public:
  // ---- CONSTRUCTOR ----
  explicit CLI(std::ostream& out = std::cout, std::ostream& err = std::cerr);


  // ---- COMMAND PROCESSING ----
  // Runs keygen, encrypt or decrypt and returns the process exit code
  int run(const CommandOptions& options);


  // ---- KEY HANDLING ----
  // Reads a hex key from key_file, or from ENCSTREAM_KEY if key_file is empty
  static std::vector<uint8_t> load_key(const std::string& key_file);
  // 64 hex characters to 32 bytes, throws UsageError on malformed input
  static std::vector<uint8_t> decode_key(const std::string& hex);
  static std::string encode_key(const std::vector<uint8_t>& key);

private:
  // ---- PARAMETERS ----
  std::ostream& out_;
  std::ostream& err_;


  // ---- COMMAND PROCESSING ----
  void handle_keygen_command(const CommandOptions& options);
  void handle_encrypt_command(const CommandOptions& options);
  void handle_decrypt_command(const CommandOptions& options);
  void require_paths(const CommandOptions& options) const;
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace encstream
