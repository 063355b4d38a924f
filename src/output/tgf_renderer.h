// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_OUTPUT_TGF_RENDERER_H_
#define FUNCMAP_OUTPUT_TGF_RENDERER_H_

#include <memory>
#include <string>

#include "core/function_renderer.h"
#include "output/report_config.h"

namespace funcmap {
namespace output {

// Trivial Graph Format renderer (yEd and friends)
// Node lines "<id> <label>", a "#" separator, then "<from> <to> <edge type>"
class TgfRenderer : public core::FunctionRenderer {
 public:
  explicit TgfRenderer(const ReportConfig& config = ReportConfig::Default());

  std::string Name() const override { return "Trivial Graph Format"; }
  std::string FileExtension() const override { return "tgf"; }
  std::string Render(const core::Function& function) const override;

 private:
  ReportConfig config_;
};

// Factory function
std::unique_ptr<core::FunctionRenderer> CreateTgfRenderer(
    const ReportConfig& config);

}  // namespace output
}  // namespace funcmap

#endif  // FUNCMAP_OUTPUT_TGF_RENDERER_H_
