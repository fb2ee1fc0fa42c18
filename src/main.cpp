#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  encstream::cli::CommandOptions command;
  std::string log_file;
  std::string log_level{"info"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " <command> [options]\n"
        << "Commands:\n"
        << "  keygen                 Generate a new key (printed, or written to -o)\n"
        << "  encrypt                Encrypt -i <input> into -o <output>\n"
        << "  decrypt                Decrypt -i <input> into -o <output>\n"
        << "Options:\n"
        << "  -i, --input <path>     Input file\n"
        << "  -o, --output <path>    Output file\n"
        << "  -k, --key <path>       File holding the hex key (default: $"
        << encstream::cli::KEY_ENV_VAR << ")\n"
        << "  --log-file <path>      Log to a file instead of stderr\n"
        << "  --log-level <level>    trace|debug|info|warning|error|fatal (default: info)\n"
        << "Example: " << program_name << " encrypt -i notes.txt -o notes.enc -k key.hex\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-i", "--input", "-o", "--output", "-k", "--key", "--log-file", "--log-level"
  };

  ProgramOptions options;
  if (argc < 2) {
    print_usage(argv[0]);
    return options;
  }
  options.command.command = argv[1];

  for (int i = 2; i < argc; i += 2) {
    const std::string flag(argv[i]);
    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[i + 1]);

    if (flag == "-i" || flag == "--input") {
      options.command.input = value;
    } else if (flag == "-o" || flag == "--output") {
      options.command.output = value;
    } else if (flag == "-k" || flag == "--key") {
      options.command.key_file = value;
    } else if (flag == "--log-file") {
      options.log_file = value;
    } else {
      options.log_level = value;
    }
  }

  options.valid = true;
  return options;
}

bool init_logging(const ProgramOptions& options) {
  try {
    const auto level = encstream::logging::parse_severity(options.log_level);
    if (options.log_file.empty()) {
      encstream::logging::init_console_logging(level);
    } else {
      encstream::logging::init_logging(options.log_file, level);
    }
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid || !init_logging(options)) {
    return encstream::cli::EXIT_USAGE;
  }

  encstream::cli::CLI cli;
  return cli.run(options.command);
}
