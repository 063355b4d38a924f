// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_ANALYSIS_RECOVERY_EVENT_H_
#define FUNCMAP_ANALYSIS_RECOVERY_EVENT_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/address.h"

namespace funcmap {
namespace analysis {

// Events emitted by control flow recovery while it walks the binary
enum class EventType {
  CALL_TO,           // function, from (call site), to (target), return_address
  RETURN_FROM,       // function, from (return site)
  TRANSIT_TO,        // function, from, to
  RETURN_FROM_CALL,  // function, from (first block after return), to
};

// "call_to", "return_from", "transit_to", "return_from_call"
const char* EventTypeName(EventType type);
bool ParseEventType(const std::string& name, EventType* type);

// One recovery event; unused address fields stay 0
struct RecoveryEvent {
  EventType type = EventType::TRANSIT_TO;
  core::Address function = 0;
  core::Address from = 0;
  core::Address to = 0;
  core::Address return_address = 0;

  static RecoveryEvent CallTo(core::Address function, core::Address from,
                              core::Address to, core::Address return_address) {
    return RecoveryEvent{EventType::CALL_TO, function, from, to,
                         return_address};
  }

  static RecoveryEvent ReturnFrom(core::Address function, core::Address from) {
    return RecoveryEvent{EventType::RETURN_FROM, function, from, 0, 0};
  }

  static RecoveryEvent TransitTo(core::Address function, core::Address from,
                                 core::Address to) {
    return RecoveryEvent{EventType::TRANSIT_TO, function, from, to, 0};
  }

  static RecoveryEvent ReturnFromCall(core::Address function,
                                      core::Address first_block,
                                      core::Address to) {
    return RecoveryEvent{EventType::RETURN_FROM_CALL, function, first_block,
                         to, 0};
  }
};

// Results of variable recovery for one function
// Unset optionals leave the function's current value alone
struct FunctionHint {
  core::Address entry = 0;
  std::optional<std::string> name;
  std::vector<int64_t> argument_registers;
  std::vector<int64_t> argument_stack_variables;
  std::optional<bool> bp_on_stack;
  std::optional<bool> retaddr_on_stack;
  std::optional<int64_t> sp_difference;
};

// A recorded recovery session
struct EventTrace {
  std::vector<RecoveryEvent> events;
  std::vector<FunctionHint> function_hints;
};

}  // namespace analysis
}  // namespace funcmap

#endif  // FUNCMAP_ANALYSIS_RECOVERY_EVENT_H_
