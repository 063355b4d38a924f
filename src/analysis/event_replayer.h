// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_ANALYSIS_EVENT_REPLAYER_H_
#define FUNCMAP_ANALYSIS_EVENT_REPLAYER_H_

#include <cstddef>

#include "analysis/recovery_event.h"
#include "core/function_registry.h"

namespace funcmap {
namespace analysis {

// Counters for one replay
struct ReplayStatistics {
  size_t call_to = 0;
  size_t return_from = 0;
  size_t transit_to = 0;
  size_t return_from_call = 0;
  size_t hints_applied = 0;
  size_t hints_skipped = 0;

  size_t TotalEvents() const {
    return call_to + return_from + transit_to + return_from_call;
  }
};

// Feeds recorded recovery events into a function registry, in order
class EventReplayer {
 public:
  explicit EventReplayer(core::FunctionRegistry* registry);

  // Route one event to the registry
  void Apply(const RecoveryEvent& event);

  // Apply variable recovery results to an existing function
  // Returns false (and changes nothing) if the function is unknown
  bool ApplyHint(const FunctionHint& hint);

  // Apply all events, then all function hints
  void Replay(const EventTrace& trace);

  const ReplayStatistics& statistics() const { return statistics_; }

 private:
  core::FunctionRegistry* registry_;
  ReplayStatistics statistics_;
};

}  // namespace analysis
}  // namespace funcmap

#endif  // FUNCMAP_ANALYSIS_EVENT_REPLAYER_H_
