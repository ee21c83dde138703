/**
 * @file command_line_parser.cpp
 * @brief Command-line argument parser implementation
 */

#include "app/command_line_parser.h"

#include <iostream>

#include "version.h"

namespace binlogsync::app {

namespace {

bool MatchesOption(const std::string& arg, const char* short_opt, const char* long_opt) {
  return arg == short_opt || arg == long_opt;
}

Error UsageError(const std::string& message) {
  return utils::MakeError(utils::ErrorCode::kInvalidArgument, message + ". Use --help for usage.");
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<CommandLineArgs, Error> CommandLineParser::Parse(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  CommandLineArgs args;
  if (argc < 1) {
    return utils::MakeUnexpected(UsageError("Invalid argument count"));
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (MatchesOption(arg, "-h", "--help")) {
      args.show_help = true;
      return args;
    }
    if (MatchesOption(arg, "-v", "--version")) {
      args.show_version = true;
      return args;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (MatchesOption(arg, "-c", "--config")) {
      if (i + 1 >= argc) {
        return utils::MakeUnexpected(UsageError("--config requires a file path"));
      }
      args.config_file = argv[++i];
    } else if (MatchesOption(arg, "-s", "--schema")) {
      if (i + 1 >= argc) {
        return utils::MakeUnexpected(UsageError("--schema requires a file path"));
      }
      args.schema_file = argv[++i];
    } else if (MatchesOption(arg, "-d", "--daemon")) {
      args.daemon_mode = true;
    } else if (MatchesOption(arg, "-t", "--config-test")) {
      args.config_test_mode = true;
    } else if (!arg.empty() && arg[0] == '-') {
      return utils::MakeUnexpected(UsageError("Unknown option: " + arg));
    } else if (args.config_file.empty()) {
      args.config_file = arg;
    } else {
      return utils::MakeUnexpected(UsageError("Unexpected argument: " + arg));
    }
  }

  if (args.config_file.empty()) {
    return utils::MakeUnexpected(UsageError("Configuration file path required"));
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return args;
}

void CommandLineParser::PrintHelp(const char* program_name) {
  std::cout << "Usage: " << program_name << " -c <config.yaml|config.json> [OPTIONS]\n"
            << "\n"
            << "Stream row changes from a MySQL/MariaDB binlog as JSON lines.\n"
            << "\n"
            << "Options:\n"
            << "  -c, --config <file>            Configuration file path\n"
            << "  -d, --daemon                   Run in the background\n"
            << "  -t, --config-test              Validate configuration and exit\n"
            << "  -s, --schema <schema.json>     Validate against a custom JSON Schema\n"
            << "  -h, --help                     Show this help message\n"
            << "  -v, --version                  Show version information\n"
            << "\n"
            << "Signals:\n"
            << "  SIGINT, SIGTERM                Close replication and exit\n"
            << "  SIGUSR1                        Reopen the log file\n";
}

void CommandLineParser::PrintVersion() {
  std::cout << Version::FullString() << "\n";
}

}  // namespace binlogsync::app
