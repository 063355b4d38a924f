// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/dot_renderer.h"

#include <sstream>

namespace funcmap {
namespace output {

DotRenderer::DotRenderer(const ReportConfig& config) : config_(config) {}

std::string DotRenderer::Render(const core::Function& function) const {
  const auto& graph = function.transition_graph();
  int digits = config_.address_digits;

  std::ostringstream out;
  out << "digraph "
      << Quote("function_" + core::FormatAddress(function.entry(), digits))
      << " {\n";
  out << "  label=" << Quote(function.DisplayName()) << ";\n";
  out << "  node [shape=box, fontname=\"monospace\"];\n";

  for (core::Address node : graph.Nodes()) {
    out << "  " << Quote(core::FormatAddress(node, digits));
    std::string label = NodeLabel(function, node);
    if (label != core::FormatAddress(node, digits)) {
      out << " [label=" << Quote(label) << "]";
    }
    out << ";\n";
  }

  for (const auto& edge : graph.Edges()) {
    out << "  " << Quote(core::FormatAddress(edge.from, digits)) << " -> "
        << Quote(core::FormatAddress(edge.to, digits));
    if (edge.label == core::EdgeType::RETURN_FROM_CALL) {
      out << " [style=dashed]";
    }
    out << ";\n";
  }

  out << "}\n";
  return out.str();
}

std::string DotRenderer::NodeLabel(const core::Function& function,
                                   core::Address address) const {
  std::string label = core::FormatAddress(address, config_.address_digits);
  if (config_.annotate_sites) {
    if (function.IsCallSite(address)) {
      label += "[Call]";
    }
    if (function.IsReturnSite(address)) {
      label += "[Ret]";
    }
  }
  return label;
}

std::string DotRenderer::Quote(const std::string& text) {
  std::string result = "\"";
  for (char c : text) {
    if (c == '"' || c == '\\') {
      result += '\\';
    }
    result += c;
  }
  result += '"';
  return result;
}

std::unique_ptr<core::FunctionRenderer> CreateDotRenderer(
    const ReportConfig& config) {
  return std::make_unique<DotRenderer>(config);
}

}  // namespace output
}  // namespace funcmap
