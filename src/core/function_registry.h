// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_CORE_FUNCTION_REGISTRY_H_
#define FUNCMAP_CORE_FUNCTION_REGISTRY_H_

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "core/address.h"
#include "core/address_graph.h"
#include "core/function.h"
#include "core/function_renderer.h"

namespace funcmap {
namespace core {

// Call graph edges carry no data: one edge per (caller, callee) pair
struct CallEdge {};

using CallGraph = AddressGraph<CallEdge>;

// Function boundaries ledger for one analysis session
// Takes intermediate results from control flow recovery and keeps the
// function map of the binary plus the inter-procedural call graph.
// Every mutator creates the named function on first reference.
class FunctionRegistry {
 public:
  FunctionRegistry();

  // Prevent copying; the driver owns exactly one registry per session
  FunctionRegistry(const FunctionRegistry&) = delete;
  FunctionRegistry& operator=(const FunctionRegistry&) = delete;

  // Recovery driver events
  void CallTo(Address function, Address from, Address to,
              Address return_address);
  void ReturnFrom(Address function, Address from);
  void TransitTo(Address function, Address from, Address to);
  void ReturnFromCall(Address function, Address first_block, Address to);

  // Queries (never create); nullptr when absent
  const Function* Lookup(Address entry) const;
  Function* Lookup(Address entry);
  bool Contains(Address entry) const;

  const std::map<Address, Function>& functions() const { return functions_; }
  size_t FunctionCount() const { return functions_.size(); }

  const CallGraph& call_graph() const { return call_graph_; }
  std::vector<Address> Callees(Address function) const;
  std::vector<Address> Callers(Address target) const;

  // "Function 0x00001000\n[0x00001000, 0x00001010]\n" for every function
  std::string DebugString(int digits = constants::kDefaultAddressDigits) const;

  // Write one artifact per function into directory, named
  // dbg_function_0x%08x.<ext>. Returns the paths written.
  // Throws RenderException if a file cannot be written.
  std::vector<std::string> DebugDraw(const FunctionRenderer& renderer,
                                     const std::string& directory) const;

  // Artifact file name for a function entry
  static std::string DebugDrawFileName(Address entry,
                                       const std::string& extension);

 private:
  // Get-or-create in one step; a new function owns its entry block
  Function& Ensure(Address entry);

  std::map<Address, Function> functions_;
  CallGraph call_graph_;
};

}  // namespace core
}  // namespace funcmap

#endif  // FUNCMAP_CORE_FUNCTION_REGISTRY_H_
