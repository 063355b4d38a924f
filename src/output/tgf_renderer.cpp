// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/tgf_renderer.h"

#include <map>
#include <sstream>

namespace funcmap {
namespace output {

TgfRenderer::TgfRenderer(const ReportConfig& config) : config_(config) {}

std::string TgfRenderer::Render(const core::Function& function) const {
  const auto& graph = function.transition_graph();

  // TGF ids are 1-based, in node order
  std::map<core::Address, size_t> ids;
  std::ostringstream out;
  for (core::Address node : graph.Nodes()) {
    size_t id = ids.size() + 1;
    ids[node] = id;
    out << id << " " << core::FormatAddress(node, config_.address_digits);
    if (config_.annotate_sites) {
      if (function.IsCallSite(node)) {
        out << "[Call]";
      }
      if (function.IsReturnSite(node)) {
        out << "[Ret]";
      }
    }
    out << "\n";
  }

  out << "#\n";
  for (const auto& edge : graph.Edges()) {
    out << ids[edge.from] << " " << ids[edge.to] << " "
        << core::EdgeTypeName(edge.label) << "\n";
  }
  return out.str();
}

std::unique_ptr<core::FunctionRenderer> CreateTgfRenderer(
    const ReportConfig& config) {
  return std::make_unique<TgfRenderer>(config);
}

}  // namespace output
}  // namespace funcmap
