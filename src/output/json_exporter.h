// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_OUTPUT_JSON_EXPORTER_H_
#define FUNCMAP_OUTPUT_JSON_EXPORTER_H_

#include <string>

#include <nlohmann/json.hpp>

#include "core/function.h"
#include "core/function_registry.h"
#include "output/report_config.h"

namespace funcmap {
namespace output {

// Writes a read-only JSON report of a registry: every function and the
// call graph. The report is a diagnostic snapshot; nothing reads it back.
class JsonExporter {
 public:
  explicit JsonExporter(const ReportConfig& config = ReportConfig::Default());

  nlohmann::json ExportFunction(const core::Function& function) const;
  nlohmann::json ExportCallGraph(const core::CallGraph& call_graph) const;
  nlohmann::json Export(const core::FunctionRegistry& registry) const;

  // Serialized report using the configured indentation
  std::string ExportString(const core::FunctionRegistry& registry) const;

  // Throws RenderException if the file cannot be written
  void WriteFile(const core::FunctionRegistry& registry,
                 const std::string& path) const;

 private:
  ReportConfig config_;

  std::string Hex(core::Address address) const;
};

}  // namespace output
}  // namespace funcmap

#endif  // FUNCMAP_OUTPUT_JSON_EXPORTER_H_
