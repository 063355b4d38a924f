// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "analysis/recovery_event.h"

namespace funcmap {
namespace analysis {

const char* EventTypeName(EventType type) {
  switch (type) {
    case EventType::CALL_TO:
      return "call_to";
    case EventType::RETURN_FROM:
      return "return_from";
    case EventType::TRANSIT_TO:
      return "transit_to";
    case EventType::RETURN_FROM_CALL:
      return "return_from_call";
  }
  return "unknown";
}

bool ParseEventType(const std::string& name, EventType* type) {
  if (name == "call_to") {
    *type = EventType::CALL_TO;
  } else if (name == "return_from") {
    *type = EventType::RETURN_FROM;
  } else if (name == "transit_to") {
    *type = EventType::TRANSIT_TO;
  } else if (name == "return_from_call") {
    *type = EventType::RETURN_FROM_CALL;
  } else {
    return false;
  }
  return true;
}

}  // namespace analysis
}  // namespace funcmap
