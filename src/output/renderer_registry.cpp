// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/renderer_registry.h"

#include "output/dot_renderer.h"
#include "output/tgf_renderer.h"
#include "utils/logger.h"

namespace funcmap {
namespace output {

RendererRegistry& RendererRegistry::Instance() {
  static RendererRegistry instance;
  return instance;
}

RendererRegistry::RendererRegistry() {
  RegisterBuiltinRenderers();
}

void RendererRegistry::RegisterBuiltinRenderers() {
  Register("dot", &CreateDotRenderer);
  Register("tgf", &CreateTgfRenderer);
}

void RendererRegistry::Register(const std::string& name,
                                RendererFactory factory) {
  factories_[name] = factory;
  LOG_DEBUG("Registered renderer: " + name);
}

std::unique_ptr<core::FunctionRenderer> RendererRegistry::Create(
    const std::string& name, const ReportConfig& config) const {
  auto it = factories_.find(name);
  if (it != factories_.end()) {
    return it->second(config);
  }
  LOG_ERROR("Renderer not found: " + name);
  return nullptr;
}

bool RendererRegistry::IsRegistered(const std::string& name) const {
  return factories_.find(name) != factories_.end();
}

std::vector<std::string> RendererRegistry::GetRegisteredNames() const {
  std::vector<std::string> names;
  for (const auto& pair : factories_) {
    names.push_back(pair.first);
  }
  return names;
}

}  // namespace output
}  // namespace funcmap
