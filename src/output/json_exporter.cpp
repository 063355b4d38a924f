// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/json_exporter.h"

#include <fstream>

#include "core/constants.h"
#include "core/exceptions.h"
#include "utils/logger.h"

using json = nlohmann::json;

namespace funcmap {
namespace output {

JsonExporter::JsonExporter(const ReportConfig& config) : config_(config) {}

std::string JsonExporter::Hex(core::Address address) const {
  return core::FormatAddress(address, config_.address_digits);
}

json JsonExporter::ExportFunction(const core::Function& function) const {
  json j;
  j["entry"] = Hex(function.entry());
  if (function.name()) {
    j["name"] = *function.name();
  } else {
    j["name"] = nullptr;
  }

  j["blocks"] = json::array();
  for (core::Address block : function.basic_blocks()) {
    j["blocks"].push_back(Hex(block));
  }

  j["edges"] = json::array();
  for (const auto& edge : function.transition_graph().Edges()) {
    j["edges"].push_back({{"from", Hex(edge.from)},
                          {"to", Hex(edge.to)},
                          {"type", core::EdgeTypeName(edge.label)}});
  }

  j["call_sites"] = json::array();
  for (const auto& [site, call] : function.call_sites()) {
    j["call_sites"].push_back({{"site", Hex(site)},
                               {"target", Hex(call.target)},
                               {"return", Hex(call.return_address)}});
  }

  j["return_sites"] = json::array();
  for (core::Address site : function.endpoints()) {
    j["return_sites"].push_back(Hex(site));
  }
  j["has_return"] = function.HasReturn();

  j["arguments"] = {{"registers", function.arguments().registers},
                    {"stack_variables", function.arguments().stack_variables}};

  j["frame"] = {{"bp_on_stack", function.bp_on_stack()},
                {"retaddr_on_stack", function.retaddr_on_stack()},
                {"sp_difference", function.sp_difference()}};
  return j;
}

json JsonExporter::ExportCallGraph(const core::CallGraph& call_graph) const {
  json j = json::array();
  for (const auto& edge : call_graph.Edges()) {
    j.push_back({{"caller", Hex(edge.from)}, {"callee", Hex(edge.to)}});
  }
  return j;
}

json JsonExporter::Export(const core::FunctionRegistry& registry) const {
  json j;
  j["version"] = constants::kReportFormatVersion;
  j["function_count"] = registry.FunctionCount();

  j["functions"] = json::array();
  for (const auto& pair : registry.functions()) {
    j["functions"].push_back(ExportFunction(pair.second));
  }
  j["call_graph"] = ExportCallGraph(registry.call_graph());
  return j;
}

std::string JsonExporter::ExportString(
    const core::FunctionRegistry& registry) const {
  return Export(registry).dump(config_.json_indent);
}

void JsonExporter::WriteFile(const core::FunctionRegistry& registry,
                             const std::string& path) const {
  std::ofstream file(path);
  if (!file) {
    throw RenderException("Failed to open report file", path);
  }
  file << ExportString(registry) << "\n";
  file.close();
  if (!file) {
    throw RenderException("Failed to write report file", path);
  }
  LOG_INFO("Report written to: " + path);
}

}  // namespace output
}  // namespace funcmap
