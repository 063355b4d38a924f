// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_OUTPUT_RENDERER_REGISTRY_H_
#define FUNCMAP_OUTPUT_RENDERER_REGISTRY_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/function_renderer.h"
#include "output/report_config.h"

namespace funcmap {
namespace output {

// Factory function type for creating renderers
using RendererFactory =
    std::unique_ptr<core::FunctionRenderer> (*)(const ReportConfig&);

// Registry for function graph renderers
class RendererRegistry {
 public:
  static RendererRegistry& Instance();

  // Register a renderer
  void Register(const std::string& name, RendererFactory factory);

  // Create a renderer by name; nullptr if unknown
  std::unique_ptr<core::FunctionRenderer> Create(
      const std::string& name,
      const ReportConfig& config = ReportConfig::Default()) const;

  // Check if a renderer is registered
  bool IsRegistered(const std::string& name) const;

  // Get list of registered renderer names
  std::vector<std::string> GetRegisteredNames() const;

  // Prevent copying
  RendererRegistry(const RendererRegistry&) = delete;
  RendererRegistry& operator=(const RendererRegistry&) = delete;

 private:
  RendererRegistry();
  void RegisterBuiltinRenderers();

  std::map<std::string, RendererFactory> factories_;
};

}  // namespace output
}  // namespace funcmap

#endif  // FUNCMAP_OUTPUT_RENDERER_REGISTRY_H_
