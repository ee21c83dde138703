/**
 * @file command_line_parser.h
 * @brief Command-line argument parser
 */

#ifndef BINLOGSYNC_APP_COMMAND_LINE_PARSER_H_
#define BINLOGSYNC_APP_COMMAND_LINE_PARSER_H_

#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Parsed command-line arguments
 */
struct CommandLineArgs {
  std::string config_file;
  std::string schema_file;  ///< Optional JSON Schema overriding the embedded one
  bool daemon_mode = false;
  bool config_test_mode = false;
  bool show_help = false;
  bool show_version = false;
};

/**
 * @brief Command-line argument parser
 *
 * Options:
 * - -c, --config <file>: configuration file (also accepted positionally)
 * - -d, --daemon: detach from the terminal
 * - -t, --config-test: validate the configuration, print a summary and exit
 * - -s, --schema <file>: custom JSON Schema
 * - -h, --help / -v, --version: take precedence over everything else
 */
class CommandLineParser {
 public:
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<CommandLineArgs, Error> Parse(int argc, char* argv[]);

  static void PrintHelp(const char* program_name);

  static void PrintVersion();

  CommandLineParser() = delete;
};

}  // namespace binlogsync::app

#endif  // BINLOGSYNC_APP_COMMAND_LINE_PARSER_H_
