// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_OUTPUT_DOT_RENDERER_H_
#define FUNCMAP_OUTPUT_DOT_RENDERER_H_

#include <memory>
#include <string>

#include "core/function_renderer.h"
#include "output/report_config.h"

namespace funcmap {
namespace output {

// Graphviz DOT renderer for transition graphs
// Call-site blocks get a [Call] suffix, return sites [Ret];
// return_from_call edges are dashed
class DotRenderer : public core::FunctionRenderer {
 public:
  explicit DotRenderer(const ReportConfig& config = ReportConfig::Default());

  std::string Name() const override { return "Graphviz DOT"; }
  std::string FileExtension() const override { return "dot"; }
  std::string Render(const core::Function& function) const override;

 private:
  ReportConfig config_;

  std::string NodeLabel(const core::Function& function,
                        core::Address address) const;
  static std::string Quote(const std::string& text);
};

// Factory function
std::unique_ptr<core::FunctionRenderer> CreateDotRenderer(
    const ReportConfig& config);

}  // namespace output
}  // namespace funcmap

#endif  // FUNCMAP_OUTPUT_DOT_RENDERER_H_
