// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include <iostream>
#include <memory>

#include "analysis/event_replayer.h"
#include "analysis/event_trace_parser.h"
#include "core/constants.h"
#include "core/exceptions.h"
#include "core/function_registry.h"
#include "output/json_exporter.h"
#include "output/renderer_registry.h"
#include "output/report_config.h"
#include "utils/cli_parser.h"
#include "utils/logger.h"

using namespace funcmap;

// Load a recorded recovery session
analysis::EventTrace LoadTrace(const std::string& path) {
  LOG_INFO("Loading event trace: " + path);

  analysis::EventTraceParser parser;
  analysis::EventTrace trace;
  std::string error;
  if (!parser.ParseFile(path, &trace, &error)) {
    throw TraceException(error, path);
  }

  LOG_INFO("Loaded " + std::to_string(trace.events.size()) + " events, " +
           std::to_string(trace.function_hints.size()) + " function hints");
  return trace;
}

// Validate option combinations that CLI11 can't express
void ValidateOptions(const utils::CliOptions& options) {
  if (!options.draw_directory.empty() &&
      !output::RendererRegistry::Instance().IsRegistered(options.renderer)) {
    std::string known;
    for (const auto& name :
         output::RendererRegistry::Instance().GetRegisteredNames()) {
      known += (known.empty() ? "" : ", ") + name;
    }
    throw ConfigException("Unknown renderer '" + options.renderer +
                          "' (available: " + known + ")");
  }
}

int main(int argc, char** argv) {
  // Parse command-line arguments
  utils::CliParser parser;
  utils::CliOptions options;
  std::string error;

  if (!parser.Parse(argc, argv, &options, &error)) {
    LOG_ERROR(error);
    std::cout << parser.GetHelp() << std::endl;
    return 1;
  }

  // Set log level
  if (options.verbose) {
    utils::Logger::Instance().SetLevel(utils::LogLevel::DEBUG);
  }

  try {
    ValidateOptions(options);

    output::ReportConfig config = output::ReportConfig::WithAddressDigits(
        options.wide_addresses ? constants::kWideAddressDigits
                               : constants::kDefaultAddressDigits);

    analysis::EventTrace trace = LoadTrace(options.input_file);

    // One registry for this analysis session
    core::FunctionRegistry registry;
    analysis::EventReplayer replayer(&registry);
    replayer.Replay(trace);

    LOG_INFO("Recovered " + std::to_string(registry.FunctionCount()) +
             " functions, " +
             std::to_string(registry.call_graph().EdgeCount()) +
             " call graph edges");

    if (options.dump) {
      std::cout << registry.DebugString(config.address_digits);
    }

    if (options.summary) {
      for (const auto& pair : registry.functions()) {
        std::cout << pair.second.ToString(config.address_digits) << "\n\n";
      }
    }

    if (!options.json_file.empty()) {
      output::JsonExporter exporter(config);
      exporter.WriteFile(registry, options.json_file);
    }

    if (!options.draw_directory.empty()) {
      auto renderer =
          output::RendererRegistry::Instance().Create(options.renderer, config);
      if (!renderer) {
        LOG_ERROR("Unknown renderer: " + options.renderer);
        return 1;
      }
      LOG_INFO("Using renderer: " + renderer->Name());
      auto written = registry.DebugDraw(*renderer, options.draw_directory);
      LOG_INFO("Rendered " + std::to_string(written.size()) +
               " functions to " + options.draw_directory);
    }

    return 0;

  } catch (const std::exception& e) {
    LOG_ERROR("Fatal error: " + std::string(e.what()));
    return 1;
  }
}
