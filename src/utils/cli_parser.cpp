// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "utils/cli_parser.h"

#include <CLI/CLI.hpp>

namespace funcmap {
namespace utils {

CliParser::CliParser() {}

bool CliParser::Parse(int argc, char** argv, CliOptions* options,
                      std::string* error) {
  CLI::App app{"funcmap - Recovered function and call graph ledger"};

  // Input options
  app.add_option("-i,--input", options->input_file,
                 "Recovery event trace (JSON)")
      ->required()
      ->check(CLI::ExistingFile);

  // Output options
  app.add_flag("--dump", options->dump, "Print the block list of every function");
  app.add_flag("--summary", options->summary,
               "Print a full summary of every function");
  app.add_option("--json", options->json_file, "Write a JSON report");
  app.add_option("--draw", options->draw_directory,
                 "Render every function's transition graph into a directory");
  app.add_option("-r,--renderer", options->renderer,
                 "Graph renderer (dot, tgf)")
      ->default_val("dot");
  app.add_flag("-w,--wide", options->wide_addresses,
               "Print addresses with 16 hex digits");
  app.add_flag("-v,--verbose", options->verbose, "Verbose output");

  // Parse
  try {
    app.parse(argc, argv);

    // Store help text
    help_text_ = app.help();

    return true;
  } catch (const CLI::ParseError& e) {
    *error = "Command-line parse error: ";
    *error += e.what();
    help_text_ = app.help();
    return false;
  }
}

std::string CliParser::GetHelp() const {
  return help_text_;
}

}  // namespace utils
}  // namespace funcmap
