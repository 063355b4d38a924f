// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/function_registry.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/exceptions.h"
#include "utils/logger.h"

namespace funcmap {
namespace core {

FunctionRegistry::FunctionRegistry() {}

Function& FunctionRegistry::Ensure(Address entry) {
  auto result = functions_.try_emplace(entry, entry);
  if (result.second) {
    result.first->second.AddBlock(entry);
    LOG_DEBUG("Created function " + FormatAddress(entry));
  }
  return result.first->second;
}

void FunctionRegistry::CallTo(Address function, Address from, Address to,
                              Address return_address) {
  Ensure(function).AddCallSite(from, to, return_address);
  call_graph_.AddEdge(function, to, CallEdge{});
}

void FunctionRegistry::ReturnFrom(Address function, Address from) {
  Ensure(function).AddReturnSite(from);
}

void FunctionRegistry::TransitTo(Address function, Address from, Address to) {
  Ensure(function).TransitTo(from, to);
}

void FunctionRegistry::ReturnFromCall(Address function, Address first_block,
                                      Address to) {
  Ensure(function).ReturnFromCall(first_block, to);
}

const Function* FunctionRegistry::Lookup(Address entry) const {
  auto it = functions_.find(entry);
  if (it != functions_.end()) {
    return &it->second;
  }
  return nullptr;
}

Function* FunctionRegistry::Lookup(Address entry) {
  auto it = functions_.find(entry);
  if (it != functions_.end()) {
    return &it->second;
  }
  return nullptr;
}

bool FunctionRegistry::Contains(Address entry) const {
  return functions_.find(entry) != functions_.end();
}

std::vector<Address> FunctionRegistry::Callees(Address function) const {
  return call_graph_.Successors(function);
}

std::vector<Address> FunctionRegistry::Callers(Address target) const {
  return call_graph_.Predecessors(target);
}

std::string FunctionRegistry::DebugString(int digits) const {
  std::ostringstream out;
  for (const auto& pair : functions_) {
    out << "Function " << FormatAddress(pair.first, digits) << "\n"
        << pair.second.DebugString(digits) << "\n";
  }
  return out.str();
}

std::string FunctionRegistry::DebugDrawFileName(Address entry,
                                                const std::string& extension) {
  return std::string(constants::kDebugDrawPrefix) + FormatAddress(entry) +
         "." + extension;
}

std::vector<std::string> FunctionRegistry::DebugDraw(
    const FunctionRenderer& renderer, const std::string& directory) const {
  std::vector<std::string> written;

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    throw RenderException("Cannot create output directory: " + ec.message(),
                          directory);
  }

  for (const auto& pair : functions_) {
    std::filesystem::path path =
        std::filesystem::path(directory) /
        DebugDrawFileName(pair.first, renderer.FileExtension());

    std::ofstream file(path);
    if (!file) {
      throw RenderException("Failed to open output file", path.string());
    }
    file << renderer.Render(pair.second);
    file.close();
    if (!file) {
      throw RenderException("Failed to write output file", path.string());
    }

    LOG_DEBUG("Rendered " + pair.second.DisplayName() + " with " +
              renderer.Name() + " to " + path.string());
    written.push_back(path.string());
  }

  return written;
}

}  // namespace core
}  // namespace funcmap
