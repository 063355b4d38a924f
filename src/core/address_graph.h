// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_CORE_ADDRESS_GRAPH_H_
#define FUNCMAP_CORE_ADDRESS_GRAPH_H_

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "core/address.h"

namespace funcmap {
namespace core {

// Directed simple graph over addresses, stored as adjacency lists
// Each (from, to) pair holds at most one edge; EdgeLabel tags that edge
// Nodes are reported in the order they were first seen
template <typename EdgeLabel>
class AddressGraph {
 public:
  struct Edge {
    Address from;
    Address to;
    EdgeLabel label;
  };

  AddressGraph() = default;

  // Add a node; no-op if already present
  void AddNode(Address node) {
    if (successors_.emplace(node, std::map<Address, EdgeLabel>()).second) {
      predecessors_.emplace(node, std::set<Address>());
      order_.push_back(node);
    }
  }

  // Add an edge, creating either endpoint if missing
  // Re-adding an existing edge replaces its label
  void AddEdge(Address from, Address to, const EdgeLabel& label) {
    AddNode(from);
    AddNode(to);
    auto& out = successors_[from];
    if (out.find(to) == out.end()) {
      ++edge_count_;
    }
    out[to] = label;
    predecessors_[to].insert(from);
  }

  bool HasNode(Address node) const {
    return successors_.find(node) != successors_.end();
  }

  bool HasEdge(Address from, Address to) const {
    auto it = successors_.find(from);
    return it != successors_.end() && it->second.count(to) > 0;
  }

  std::optional<EdgeLabel> GetEdgeLabel(Address from, Address to) const {
    auto it = successors_.find(from);
    if (it == successors_.end()) {
      return std::nullopt;
    }
    auto edge = it->second.find(to);
    if (edge == it->second.end()) {
      return std::nullopt;
    }
    return edge->second;
  }

  // Successor addresses of node, ascending; empty if node is unknown
  std::vector<Address> Successors(Address node) const {
    std::vector<Address> result;
    auto it = successors_.find(node);
    if (it != successors_.end()) {
      for (const auto& pair : it->second) {
        result.push_back(pair.first);
      }
    }
    return result;
  }

  // Predecessor addresses of node, ascending; empty if node is unknown
  std::vector<Address> Predecessors(Address node) const {
    auto it = predecessors_.find(node);
    if (it == predecessors_.end()) {
      return {};
    }
    return std::vector<Address>(it->second.begin(), it->second.end());
  }

  const std::vector<Address>& Nodes() const { return order_; }

  // All edges, grouped by source in node insertion order
  std::vector<Edge> Edges() const {
    std::vector<Edge> result;
    result.reserve(edge_count_);
    for (Address from : order_) {
      for (const auto& pair : successors_.at(from)) {
        result.push_back(Edge{from, pair.first, pair.second});
      }
    }
    return result;
  }

  size_t NodeCount() const { return order_.size(); }
  size_t EdgeCount() const { return edge_count_; }
  bool Empty() const { return order_.empty(); }

 private:
  std::map<Address, std::map<Address, EdgeLabel>> successors_;
  std::map<Address, std::set<Address>> predecessors_;
  std::vector<Address> order_;
  size_t edge_count_ = 0;
};

}  // namespace core
}  // namespace funcmap

#endif  // FUNCMAP_CORE_ADDRESS_GRAPH_H_
