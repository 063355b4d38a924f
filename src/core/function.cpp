// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/function.h"

#include <algorithm>
#include <sstream>

namespace funcmap {
namespace core {

namespace {

void AppendOffsetIfAbsent(std::vector<int64_t>* offsets, int64_t offset) {
  if (std::find(offsets->begin(), offsets->end(), offset) == offsets->end()) {
    offsets->push_back(offset);
  }
}

std::string FormatOffsets(const std::vector<int64_t>& offsets) {
  std::ostringstream out;
  out << "[";
  for (size_t i = 0; i < offsets.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << offsets[i];
  }
  out << "]";
  return out.str();
}

}  // namespace

const char* EdgeTypeName(EdgeType type) {
  switch (type) {
    case EdgeType::TRANSITION:
      return "transition";
    case EdgeType::RETURN_FROM_CALL:
      return "return_from_call";
  }
  return "unknown";
}

Function::Function(Address entry) : entry_(entry) {}

void Function::AddBlock(Address address) {
  transition_graph_.AddNode(address);
}

void Function::TransitTo(Address from, Address to) {
  transition_graph_.AddEdge(from, to, EdgeType::TRANSITION);
}

void Function::ReturnFromCall(Address first_block, Address to) {
  transition_graph_.AddEdge(first_block, to, EdgeType::RETURN_FROM_CALL);
}

void Function::AddReturnSite(Address address) {
  return_sites_.insert(address);
}

std::vector<Address> Function::endpoints() const {
  return std::vector<Address>(return_sites_.begin(), return_sites_.end());
}

void Function::AddCallSite(Address call_site, Address target,
                           Address return_address) {
  // Drop the mirror of an overwritten record so the two maps stay in step
  std::optional<Address> freed;
  auto previous = call_sites_.find(call_site);
  if (previous != call_sites_.end() &&
      previous->second.return_address != return_address) {
    auto stale = return_to_call_site_.find(previous->second.return_address);
    if (stale != return_to_call_site_.end() && stale->second == call_site) {
      freed = stale->first;
      return_to_call_site_.erase(stale);
    }
  }

  call_sites_[call_site] = CallSite{target, return_address};
  return_to_call_site_[return_address] = call_site;

  // Another site may still return to the freed address
  if (freed) {
    for (const auto& pair : call_sites_) {
      if (pair.second.return_address == *freed) {
        return_to_call_site_[*freed] = pair.first;
        break;
      }
    }
  }
}

std::vector<Address> Function::GetCallSites() const {
  std::vector<Address> result;
  result.reserve(call_sites_.size());
  for (const auto& pair : call_sites_) {
    result.push_back(pair.first);
  }
  return result;
}

std::optional<Address> Function::GetCallTarget(Address call_site) const {
  auto it = call_sites_.find(call_site);
  if (it != call_sites_.end()) {
    return it->second.target;
  }
  return std::nullopt;
}

std::optional<Address> Function::GetCallReturn(Address call_site) const {
  auto it = call_sites_.find(call_site);
  if (it != call_sites_.end()) {
    return it->second.return_address;
  }
  return std::nullopt;
}

std::optional<Address> Function::GetCallSiteForReturn(
    Address return_address) const {
  auto it = return_to_call_site_.find(return_address);
  if (it != return_to_call_site_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool Function::IsCallSite(Address address) const {
  return call_sites_.find(address) != call_sites_.end();
}

bool Function::IsReturnSite(Address address) const {
  return return_sites_.find(address) != return_sites_.end();
}

void Function::AddArgumentRegister(int64_t offset) {
  AppendOffsetIfAbsent(&arguments_.registers, offset);
}

void Function::AddArgumentStackVariable(int64_t offset) {
  AppendOffsetIfAbsent(&arguments_.stack_variables, offset);
}

std::string Function::DisplayName() const {
  std::ostringstream out;
  out << "<Function ";
  if (name_) {
    out << *name_ << " (" << FormatAddress(entry_, 1) << ")";
  } else {
    out << FormatAddress(entry_, 1);
  }
  out << ">";
  return out.str();
}

std::string Function::ToString(int digits) const {
  std::ostringstream out;
  out << "Function ";
  if (name_) {
    out << *name_ << " ";
  }
  out << "[" << FormatAddress(entry_, digits) << "]\n";
  out << "SP difference: " << sp_difference_ << "\n";
  out << "Has return: " << (HasReturn() ? "true" : "false") << "\n";
  out << "Arguments: reg: " << FormatOffsets(arguments_.registers)
      << ", stack: " << FormatOffsets(arguments_.stack_variables) << "\n";
  out << "Blocks: " << DebugString(digits);
  return out.str();
}

std::string Function::DebugString(int digits) const {
  std::ostringstream out;
  out << "[";
  const auto& blocks = transition_graph_.Nodes();
  for (size_t i = 0; i < blocks.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << FormatAddress(blocks[i], digits);
  }
  out << "]";
  return out.str();
}

}  // namespace core
}  // namespace funcmap
