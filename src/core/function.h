// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_CORE_FUNCTION_H_
#define FUNCMAP_CORE_FUNCTION_H_

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/address.h"
#include "core/address_graph.h"

namespace funcmap {
namespace core {

// Kind of control transfer recorded in a transition graph
enum class EdgeType {
  TRANSITION,        // Fallthrough or branch inside the function
  RETURN_FROM_CALL,  // Control resumes here after a call made by the function
};

const char* EdgeTypeName(EdgeType type);

using TransitionGraph = AddressGraph<EdgeType>;

// Call made from a call-site block
struct CallSite {
  Address target;
  Address return_address;  // Inferred from calling convention, not observed
};

// Argument locations recovered for a function, in discovery order
struct FunctionArguments {
  std::vector<int64_t> registers;        // Register file offsets
  std::vector<int64_t> stack_variables;  // Stack offsets
};

// Everything known about one recovered function
// Mutators never fail and are idempotent under repeated identical input
class Function {
 public:
  explicit Function(Address entry);

  Address entry() const { return entry_; }

  const std::optional<std::string>& name() const { return name_; }
  void set_name(const std::string& name) { name_ = name; }

  // Control flow
  void AddBlock(Address address);
  void TransitTo(Address from, Address to);
  void ReturnFromCall(Address first_block, Address to);

  // Return sites
  void AddReturnSite(Address address);
  std::vector<Address> endpoints() const;
  bool HasReturn() const { return !return_sites_.empty(); }

  // Call sites
  // Replaces any previous record for call_site (last write wins)
  void AddCallSite(Address call_site, Address target, Address return_address);
  std::vector<Address> GetCallSites() const;
  std::optional<Address> GetCallTarget(Address call_site) const;
  std::optional<Address> GetCallReturn(Address call_site) const;
  std::optional<Address> GetCallSiteForReturn(Address return_address) const;
  bool IsCallSite(Address address) const;
  bool IsReturnSite(Address address) const;

  const std::map<Address, CallSite>& call_sites() const { return call_sites_; }
  const std::map<Address, Address>& return_to_call_site() const {
    return return_to_call_site_;
  }

  // Arguments (append if absent, insertion order kept)
  void AddArgumentRegister(int64_t offset);
  void AddArgumentStackVariable(int64_t offset);
  const FunctionArguments& arguments() const { return arguments_; }

  // Frame shape, filled in by variable recovery
  bool bp_on_stack() const { return bp_on_stack_; }
  void set_bp_on_stack(bool value) { bp_on_stack_ = value; }

  bool retaddr_on_stack() const { return retaddr_on_stack_; }
  void set_retaddr_on_stack(bool value) { retaddr_on_stack_ = value; }

  int64_t sp_difference() const { return sp_difference_; }
  void set_sp_difference(int64_t value) { sp_difference_ = value; }

  // Graph views
  const std::vector<Address>& basic_blocks() const {
    return transition_graph_.Nodes();
  }
  const TransitionGraph& transition_graph() const { return transition_graph_; }

  // "<Function name (0x1000)>" or "<Function 0x1000>"
  std::string DisplayName() const;

  // Multi-line summary: header, SP difference, return, arguments, blocks
  std::string ToString(int digits = constants::kDefaultAddressDigits) const;

  // "[0x00001000, 0x00001010]"
  std::string DebugString(int digits = constants::kDefaultAddressDigits) const;

 private:
  Address entry_;
  std::optional<std::string> name_;

  TransitionGraph transition_graph_;
  std::set<Address> return_sites_;
  std::map<Address, CallSite> call_sites_;
  std::map<Address, Address> return_to_call_site_;

  FunctionArguments arguments_;

  bool bp_on_stack_ = false;
  bool retaddr_on_stack_ = false;
  int64_t sp_difference_ = 0;
};

}  // namespace core
}  // namespace funcmap

#endif  // FUNCMAP_CORE_FUNCTION_H_
