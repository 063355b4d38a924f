// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_UTILS_CLI_PARSER_H_
#define FUNCMAP_UTILS_CLI_PARSER_H_

#include <string>

namespace funcmap {
namespace utils {

// Command-line options parsed from arguments
struct CliOptions {
  // Required
  std::string input_file;  // Recorded recovery event trace (JSON)

  // Output options
  bool dump = false;             // Print every function's block list
  bool summary = false;          // Print every function's full summary
  std::string json_file;         // JSON report path
  std::string draw_directory;    // One rendered graph per function
  std::string renderer = "dot";
  bool wide_addresses = false;   // 16 hex digits instead of 8

  bool verbose = false;
};

// CLI parser
class CliParser {
 public:
  CliParser();

  // Parse command-line arguments
  bool Parse(int argc, char** argv, CliOptions* options, std::string* error);

  // Get help text
  std::string GetHelp() const;

 private:
  std::string help_text_;
};

}  // namespace utils
}  // namespace funcmap

#endif  // FUNCMAP_UTILS_CLI_PARSER_H_
