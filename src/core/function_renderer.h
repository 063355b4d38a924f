// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_CORE_FUNCTION_RENDERER_H_
#define FUNCMAP_CORE_FUNCTION_RENDERER_H_

#include <string>

#include "core/function.h"

namespace funcmap {
namespace core {

// Turns one function's transition graph into a presentation artifact
// Layout and imaging belong to whatever consumes the artifact
class FunctionRenderer {
 public:
  virtual ~FunctionRenderer() = default;

  // Renderer identification
  virtual std::string Name() const = 0;

  // File extension without the dot, e.g. "dot"
  virtual std::string FileExtension() const = 0;

  // Render the whole function as artifact text
  virtual std::string Render(const Function& function) const = 0;
};

}  // namespace core
}  // namespace funcmap

#endif  // FUNCMAP_CORE_FUNCTION_RENDERER_H_
